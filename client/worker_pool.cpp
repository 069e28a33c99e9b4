#include "worker_pool.hpp"

#include "errors.hpp"

#include <random>

WorkerPool::WorkerPool(int num_workers, StoreClientFactory factory, const IWorkload& workload_template,
                       std::shared_ptr<RunStats> stats, ShutdownSignal& shutdown, Seed seed)
    : num_workers_(0), factory_(std::move(factory)), workload_template_(workload_template.Clone()),
      stats_(std::move(stats)), shutdown_(shutdown), seed_(seed) {
    if (num_workers < 1) {
        throw ConfigError("Number of clients must be at least 1, got " + std::to_string(num_workers));
    }
    if (!stats_) {
        throw std::invalid_argument("Worker pool needs a stats sink");
    }
    num_workers_ = static_cast<size_t>(num_workers);
}

WorkerPool::~WorkerPool() {
    Join();
}

void WorkerPool::Start(const Deadline& deadline) {
    if (!threads_.empty()) {
        throw std::logic_error("Worker pool already started");
    }

    std::vector<std::unique_ptr<IStoreClient>> clients;
    clients.reserve(num_workers_);
    for (size_t i = 0; i < num_workers_; ++i) {
        clients.push_back(factory_());
        if (!clients.back()) {
            throw std::runtime_error("Store client factory returned no client");
        }
    }

    reports_.assign(num_workers_, WorkerReport{});
    threads_.reserve(num_workers_);
    for (size_t i = 0; i < num_workers_; ++i) {
        threads_.emplace_back(&WorkerPool::WorkerLoop, this, i, std::move(clients[i]),
                              workload_template_->Clone(), deadline);
    }
}

bool WorkerPool::WaitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return done_cv_.wait_for(lock, timeout, [this]() { return finished_ == threads_.size(); });
}

void WorkerPool::Join() {
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

void WorkerPool::WorkerLoop(size_t id, std::unique_ptr<IStoreClient> client, std::unique_ptr<IWorkload> workload,
                            Deadline deadline) {
    std::mt19937 gen;
    seed_engine(gen, derive_seed(seed_, static_cast<uint32_t>(id)));

    // Only this thread touches its slot until Join()
    WorkerReport& report = reports_[id];

    while (!shutdown_.IsSet() && !deadline.Expired()) {
        try {
            size_t bytes = workload->Execute(*client, gen);
            stats_->RecordSuccess(bytes);
            report.success_bulks++;
            report.bytes += bytes;
        } catch (const std::exception&) {
            stats_->RecordFailure();
            report.failed_bulks++;
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_++;
    }
    done_cv_.notify_all();
}
