#pragma once

#include "endpoint.hpp"
#include "store_client.hpp"

#include <string>
#include <vector>

struct Credentials {
    std::string username;
    std::string password;
};

/**
 * @brief Everything a run needs, already parsed. Counts apply per endpoint.
 */
struct RunConfig {
    std::vector<Endpoint> endpoints;
    int indices = 0;
    int documents = 0;
    int clients = 0;
    int seconds = 0;
    bool use_https = false;
    Credentials credentials;
    ShardConfig shards;
    int bulk_size = 1000;
    int max_fields_per_document = 100;
    int max_size_per_field = 1000;
    bool no_cleanup = false;
    int stats_frequency = 30;
    bool wait_for_green = true;
    int health_timeout = 600;
    int seed = -1;
    std::string results_file;

    // Throws ConfigError describing the first invalid setting.
    void Validate() const;
};

struct CommandLine {
    RunConfig config;
    bool show_help = false;
    std::string help;
};

/**
 * @brief Parses and validates the es_load command line.
 * @throws ConfigError on unknown or malformed options, missing required
 * options, or an invalid configuration.
 */
CommandLine parse_command_line(int argc, char** argv);
