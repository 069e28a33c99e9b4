#include "utils.h"
#include <sstream>
#include <fstream>
#include <iomanip>
#include <cctype>
#include <iostream>

void ConsoleSink::Info(const std::string& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << msg << '\n';
    out_.flush();
}

void ConsoleSink::Error(const std::string& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    err_ << msg << '\n';
    err_.flush();
}

void ConsoleSink::Raw(const std::string& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << msg;
    out_.flush();
}

Seed derive_seed(const Seed& seed, uint32_t offset) {
    if (!seed) return std::nullopt;
    return static_cast<uint32_t>(*seed + offset);
}

void seed_engine(std::mt19937& gen, const Seed& seed) {
    if (seed) {
        gen.seed(*seed);
    } else {
        gen.seed(std::random_device{}());
    }
}

std::string fixed_lowercase_string(std::mt19937& gen, int len) {
    std::uniform_int_distribution<int> letter('a', 'z');
    std::string s;
    s.reserve(static_cast<size_t>(len));
    for (int i = 0; i < len; ++i) {
        s.push_back(static_cast<char>(letter(gen)));
    }
    return s;
}

std::string random_lowercase_string(std::mt19937& gen, int max_len) {
    std::uniform_int_distribution<int> length(1, max_len);
    return fixed_lowercase_string(gen, length(gen));
}

// Append a TestResult as a JSON object to a results file that contains a JSON array.
// If the file doesn't exist, it will be created with a single-element array.
void append_result_to_file(const TestResult& r, const std::string& path) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    ss << "{"
       << "\"endpoints\": " << r.endpoints << ", "
       << "\"clients\": " << r.clients << ", "
       << "\"duration_sec\": " << r.duration_sec << ", "
       << "\"success_bulks\": " << r.success_bulks << ", "
       << "\"failed_bulks\": " << r.failed_bulks << ", "
       << "\"success_documents\": " << r.success_documents << ", "
       << "\"failed_documents\": " << r.failed_documents << ", "
       << "\"megabytes\": " << r.megabytes << ", "
       << "\"throughput_mbps\": " << r.throughput_mbps << ", "
       << "\"interrupted\": " << (r.interrupted ? "true" : "false")
       << "}";

    std::string obj = ss.str();

    std::ifstream in(path);
    if (!in.good()) {
        std::ofstream out(path, std::ios::trunc);
        out << "[" << obj << "]\n";
        return;
    }

    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    in.close();

    while (!content.empty() && isspace(static_cast<unsigned char>(content.back()))) content.pop_back();

    // Anything that isn't a JSON array gets overwritten
    size_t first_non_ws = content.find_first_not_of(" \t\n\r");
    size_t last_bracket = content.find_last_of(']');
    if (first_non_ws == std::string::npos || content[first_non_ws] != '[' ||
        last_bracket == std::string::npos || last_bracket < first_non_ws) {
        std::ofstream out(path, std::ios::trunc);
        out << "[" << obj << "]\n";
        return;
    }

    bool array_empty = true;
    for (size_t i = first_non_ws + 1; i < last_bracket; ++i) {
        if (!isspace(static_cast<unsigned char>(content[i]))) { array_empty = false; break; }
    }

    std::ofstream out(path, std::ios::trunc);
    if (array_empty) {
        out << "[" << obj << "]\n";
    } else {
        std::string prefix = content.substr(0, last_bracket);
        out << prefix << ",\n" << obj << "]\n";
    }
}
