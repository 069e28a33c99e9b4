#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

struct StatsSnapshot {
    long long success_bulks = 0;
    long long failed_bulks = 0;
    uint64_t bytes = 0;
    double elapsed_sec = 0.0;
};

struct DerivedStats {
    double elapsed_sec = 0.0;
    long long success_bulks = 0;
    long long success_documents = 0;
    long long failed_bulks = 0;
    long long failed_documents = 0;
    double megabytes = 0.0;
    double megabytes_per_sec = 0.0;
};

/**
 * @brief Shared outcome counters of a run.
 *
 * The three counters are independent atomics, so a success and a failure
 * recorded at the same time never contend. A snapshot may show slight skew
 * between counters but each counter is exact and never decreases.
 */
class RunStats {
public:
    using Clock = std::chrono::steady_clock;

    RunStats() : start_(Clock::now()) {}

    // Must be called before any worker or reporter thread is started.
    void MarkStart(Clock::time_point start) { start_ = start; }

    void RecordSuccess(uint64_t bytes) {
        success_bulks_.fetch_add(1, std::memory_order_relaxed);
        bytes_.fetch_add(bytes, std::memory_order_relaxed);
    }

    void RecordFailure() {
        failed_bulks_.fetch_add(1, std::memory_order_relaxed);
    }

    StatsSnapshot Snapshot() const { return Snapshot(Clock::now()); }
    StatsSnapshot Snapshot(Clock::time_point now) const;

private:
    std::atomic<long long> success_bulks_{0};
    std::atomic<long long> failed_bulks_{0};
    std::atomic<uint64_t> bytes_{0};
    Clock::time_point start_;
};

/**
 * @brief Turns raw counters into the figures printed to the operator.
 * An elapsed time of zero yields zero MB/s.
 */
DerivedStats derive_stats(const StatsSnapshot& snapshot, int bulk_size);

// Multi-line, human readable block ending with an empty line.
std::string format_stats(const DerivedStats& stats);
