#pragma once

#include "run_stats.hpp"
#include "shutdown.hpp"
#include "store_client.hpp"
#include "utils.h"
#include "workload.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

// What a single worker observed by itself over the run.
struct WorkerReport {
    long long success_bulks = 0;
    long long failed_bulks = 0;
    uint64_t bytes = 0;
};

/**
 * @brief A fixed set of closed-loop worker threads.
 *
 * Every worker owns a store client and a clone of the workload and keeps
 * issuing requests until the shutdown signal is set or the deadline has
 * passed. Both are checked before each request; a request already in
 * flight always runs to completion. Failed requests are counted and never
 * retried.
 */
class WorkerPool {
public:
    /**
     * @param num_workers       Number of threads, at least 1.
     * @param factory           Produces one store client per worker.
     * @param workload_template Cloned once per worker.
     * @param stats             Shared counters all workers record into.
     * @param shutdown          Observed by every worker; must outlive the pool.
     * @param seed              Unset seeds from std::random_device, otherwise
     *                          worker i uses seed + i (mod 2^32).
     */
    WorkerPool(int num_workers, StoreClientFactory factory, const IWorkload& workload_template,
               std::shared_ptr<RunStats> stats, ShutdownSignal& shutdown, Seed seed = std::nullopt);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Creates every worker's client, then spawns the threads.
     * A client factory failure propagates before any thread is started.
     */
    void Start(const Deadline& deadline);

    // True once every started worker has left its loop.
    bool WaitFor(std::chrono::milliseconds timeout);

    void Join();

    // Per-worker results, valid after Join().
    const std::vector<WorkerReport>& Reports() const { return reports_; }

    size_t size() const { return num_workers_; }

private:
    void WorkerLoop(size_t id, std::unique_ptr<IStoreClient> client, std::unique_ptr<IWorkload> workload,
                    Deadline deadline);

    size_t num_workers_;
    StoreClientFactory factory_;
    std::unique_ptr<IWorkload> workload_template_;
    std::shared_ptr<RunStats> stats_;
    ShutdownSignal& shutdown_;
    Seed seed_;

    std::vector<std::thread> threads_;
    std::vector<WorkerReport> reports_;

    std::mutex mutex_;
    std::condition_variable done_cv_;
    size_t finished_ = 0;
};
