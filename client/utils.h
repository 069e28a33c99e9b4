#pragma once

#include "TestResults.hpp"
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <random>
#include <string>

/**
 * @brief Serializes console output shared by the main thread and the
 * stats reporter thread. Every call writes one complete message.
 */
class ConsoleSink {
public:
    ConsoleSink(std::ostream& out, std::ostream& err) : out_(out), err_(err) {}

    void Info(const std::string& msg);
    void Error(const std::string& msg);

    // Writes msg verbatim, without appending a newline.
    void Raw(const std::string& msg);

private:
    std::ostream& out_;
    std::ostream& err_;
    std::mutex mutex_;
};

// Unset means the engine is seeded from std::random_device.
using Seed = std::optional<uint32_t>;

// seed + offset modulo 2^32; an unset seed stays unset.
Seed derive_seed(const Seed& seed, uint32_t offset);

void seed_engine(std::mt19937& gen, const Seed& seed);

// Random string of [a-z] with a length drawn uniformly from [1, max_len].
std::string random_lowercase_string(std::mt19937& gen, int max_len);

// Random string of [a-z] of exactly len characters.
std::string fixed_lowercase_string(std::mt19937& gen, int len);

void append_result_to_file(const TestResult& r, const std::string& path);
