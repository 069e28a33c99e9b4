#include "run_stats.hpp"

#include <iomanip>
#include <sstream>

StatsSnapshot RunStats::Snapshot(Clock::time_point now) const {
    StatsSnapshot s;
    s.success_bulks = success_bulks_.load(std::memory_order_relaxed);
    s.failed_bulks = failed_bulks_.load(std::memory_order_relaxed);
    s.bytes = bytes_.load(std::memory_order_relaxed);
    s.elapsed_sec = now > start_ ? std::chrono::duration<double>(now - start_).count() : 0.0;
    return s;
}

DerivedStats derive_stats(const StatsSnapshot& snapshot, int bulk_size) {
    DerivedStats d;
    d.elapsed_sec = snapshot.elapsed_sec;
    d.success_bulks = snapshot.success_bulks;
    d.success_documents = snapshot.success_bulks * bulk_size;
    d.failed_bulks = snapshot.failed_bulks;
    d.failed_documents = snapshot.failed_bulks * bulk_size;
    d.megabytes = static_cast<double>(snapshot.bytes) / 1024.0 / 1024.0;
    if (snapshot.elapsed_sec > 0.0) {
        d.megabytes_per_sec = d.megabytes / snapshot.elapsed_sec;
    }
    return d;
}

std::string format_stats(const DerivedStats& stats) {
    std::ostringstream ss;
    ss << "Elapsed time: " << static_cast<long long>(stats.elapsed_sec) << " seconds\n"
       << "Successful bulks: " << stats.success_bulks << " (" << stats.success_documents << " documents)\n"
       << "Failed bulks: " << stats.failed_bulks << " (" << stats.failed_documents << " documents)\n"
       << std::fixed << std::setprecision(2)
       << "Indexed approximately " << stats.megabytes << " MB which is "
       << stats.megabytes_per_sec << " MB/s\n"
       << "\n";
    return ss.str();
}
