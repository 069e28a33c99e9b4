#include "shutdown.hpp"

#include <csignal>

void ShutdownSignal::Set() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        set_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

bool ShutdownSignal::WaitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return set_.load(std::memory_order_acquire); });
}

std::atomic<int> InterruptWatcher::count_{0};

static_assert(std::atomic<int>::is_always_lock_free, "signal handler needs a lock-free counter");

void InterruptWatcher::Install() {
    std::signal(SIGINT, &InterruptWatcher::Handle);
    std::signal(SIGTERM, &InterruptWatcher::Handle);
}

bool InterruptWatcher::Triggered() {
    return count_.load() > 0;
}

void InterruptWatcher::Handle(int sig) {
    if (count_.fetch_add(1) > 0) {
        std::signal(sig, SIG_DFL);
        std::raise(sig);
        return;
    }
    // Some platforms reset the handler after delivery
    std::signal(sig, &InterruptWatcher::Handle);
}
