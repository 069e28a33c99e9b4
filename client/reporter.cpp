#include "reporter.hpp"

#include <stdexcept>

StatsReporter::StatsReporter(std::shared_ptr<const RunStats> stats, int bulk_size, ShutdownSignal& shutdown,
                             ConsoleSink& console, std::chrono::milliseconds interval)
    : stats_(std::move(stats)), bulk_size_(bulk_size), shutdown_(shutdown), console_(console),
      interval_(interval) {
    if (interval_.count() <= 0) {
        throw std::invalid_argument("Stats interval must be positive");
    }
}

StatsReporter::~StatsReporter() {
    Join();
}

void StatsReporter::Start(const Deadline& deadline) {
    if (thread_.joinable()) {
        throw std::logic_error("Stats reporter already started");
    }
    thread_ = std::thread(&StatsReporter::Loop, this, deadline);
}

void StatsReporter::Join() {
    if (thread_.joinable()) thread_.join();
}

void StatsReporter::Loop(Deadline deadline) {
    while (!shutdown_.IsSet() && !deadline.Expired()) {
        if (shutdown_.WaitFor(interval_)) {
            break;
        }
        // To avoid double printing with the final summary
        if (!deadline.Expired()) {
            console_.Raw(format_stats(derive_stats(stats_->Snapshot(), bulk_size_)));
            reports_printed_++;
        }
    }
}
