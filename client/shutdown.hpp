#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

/**
 * @brief Run-wide cancellation flag.
 *
 * Once set it stays set. Workers poll IsSet() between batches; the
 * reporter sleeps in WaitFor() and is woken as soon as Set() is called.
 */
class ShutdownSignal {
public:
    ShutdownSignal() = default;
    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;

    // Idempotent.
    void Set();

    bool IsSet() const { return set_.load(std::memory_order_acquire); }

    // Returns true if the signal is set, false if the timeout elapsed first.
    bool WaitFor(std::chrono::milliseconds timeout);

private:
    std::atomic<bool> set_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

/**
 * @brief Start time plus run duration. Each thread evaluates it on its own.
 */
class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    Deadline(Clock::time_point start, std::chrono::milliseconds duration)
        : start_(start), end_(start + duration) {}

    static Deadline FromNow(std::chrono::milliseconds duration) {
        return Deadline(Clock::now(), duration);
    }

    bool Expired() const { return Clock::now() >= end_; }

    Clock::time_point start() const { return start_; }
    Clock::time_point end() const { return end_; }

private:
    Clock::time_point start_;
    Clock::time_point end_;
};

/**
 * @brief Installs SIGINT/SIGTERM handlers that record the interrupt.
 *
 * The first signal is only recorded, the orchestrator polls Triggered()
 * and drains the run. A second signal restores the default disposition
 * and re-raises, terminating the process.
 */
class InterruptWatcher {
public:
    static void Install();
    static bool Triggered();

private:
    static void Handle(int sig);
    static std::atomic<int> count_;
};
