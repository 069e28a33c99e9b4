#pragma once

#include "run_stats.hpp"
#include "shutdown.hpp"
#include "utils.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

/**
 * @brief Prints the running totals every interval until the run ends.
 *
 * A wake-up that finds the deadline passed prints nothing, leaving the
 * numbers to the final summary.
 */
class StatsReporter {
public:
    StatsReporter(std::shared_ptr<const RunStats> stats, int bulk_size, ShutdownSignal& shutdown,
                  ConsoleSink& console, std::chrono::milliseconds interval);
    ~StatsReporter();

    StatsReporter(const StatsReporter&) = delete;
    StatsReporter& operator=(const StatsReporter&) = delete;

    void Start(const Deadline& deadline);
    void Join();

    int reports_printed() const { return reports_printed_.load(); }

private:
    void Loop(Deadline deadline);

    std::shared_ptr<const RunStats> stats_;
    int bulk_size_;
    ShutdownSignal& shutdown_;
    ConsoleSink& console_;
    std::chrono::milliseconds interval_;
    std::thread thread_;
    std::atomic<int> reports_printed_{0};
};
