#pragma once
#include <string>

struct TestResult {
    int endpoints;
    int clients;                  // workers per endpoint
    int duration_sec;
    long long success_bulks;
    long long failed_bulks;
    long long success_documents;
    long long failed_documents;
    double megabytes;
    double throughput_mbps;
    bool interrupted;
};
