#include "run_config.hpp"

#include "errors.hpp"

// Host groups are comma separated, so vector options split on ';' instead
#define CXXOPTS_VECTOR_DELIMITER ';'
#include <cxxopts.hpp>

namespace {
    void require_at_least(int value, int min, const char* what) {
        if (value < min) {
            throw ConfigError(std::string(what) + " must be at least " + std::to_string(min) + ", got " +
                              std::to_string(value));
        }
    }
}

void RunConfig::Validate() const {
    if (endpoints.empty()) {
        throw ConfigError("At least one --es_address is required");
    }
    require_at_least(indices, 1, "Number of indices");
    require_at_least(documents, 1, "Number of documents");
    require_at_least(clients, 1, "Number of clients");
    require_at_least(seconds, 1, "Number of seconds");
    require_at_least(shards.number_of_shards, 1, "Number of shards");
    require_at_least(shards.number_of_replicas, 0, "Number of replicas");
    require_at_least(bulk_size, 1, "Bulk size");
    require_at_least(max_fields_per_document, 1, "Max fields per document");
    require_at_least(max_size_per_field, 1, "Max size per field");
    require_at_least(stats_frequency, 1, "Stats frequency");
    require_at_least(health_timeout, 1, "Health timeout");
    if (seed < -1) {
        throw ConfigError("Seed must be -1 (random) or non-negative");
    }
}

CommandLine parse_command_line(int argc, char** argv) {
    cxxopts::Options options("es_load", "Stress test tool for Elasticsearch");

    options.add_options()
        ("es_address", "The address(es) of your cluster (no protocol, port optional); "
            "comma separated hosts form one cluster", cxxopts::value<std::vector<std::string>>())
        ("indices", "The number of indices to write to for each address", cxxopts::value<int>())
        ("documents", "The number of different documents to write for each address", cxxopts::value<int>())
        ("clients", "The number of clients to write from for each address", cxxopts::value<int>())
        ("seconds", "The number of seconds to run", cxxopts::value<int>())
        ("use_https", "Use https. Otherwise use http")
        ("username", "The user, if required, to connect to the cluster",
            cxxopts::value<std::string>()->default_value(""))
        ("password", "The password, if required, to connect to the cluster",
            cxxopts::value<std::string>()->default_value(""))
        ("number-of-shards", "Number of shards per index", cxxopts::value<int>()->default_value("3"))
        ("number-of-replicas", "Number of replicas per index", cxxopts::value<int>()->default_value("1"))
        ("bulk-size", "Number of documents per request", cxxopts::value<int>()->default_value("1000"))
        ("max-fields-per-document", "Max number of fields in each document",
            cxxopts::value<int>()->default_value("100"))
        ("max-size-per-field", "Max content size per field", cxxopts::value<int>()->default_value("1000"))
        ("no-cleanup", "Don't delete the indices upon finish")
        ("stats-frequency", "Number of seconds to wait between stats prints",
            cxxopts::value<int>()->default_value("30"))
        ("not-green", "Don't wait for the cluster to be green before starting")
        ("health-timeout", "Seconds to wait for green status", cxxopts::value<int>()->default_value("600"))
        ("seed", "Random seed, -1 for a random one", cxxopts::value<int>()->default_value("-1"))
        ("results-file", "Append the final results as JSON to this file",
            cxxopts::value<std::string>()->default_value(""))
        ("h,help", "Print usage");

    // Extra bare arguments are further addresses: --es_address a b c
    options.parse_positional({"es_address"});

    CommandLine cmd;
    RunConfig& cfg = cmd.config;
    std::vector<std::string> addresses;

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            cmd.show_help = true;
            cmd.help = options.help();
            return cmd;
        }

        for (const char* required : {"es_address", "indices", "documents", "clients", "seconds"}) {
            if (!result.count(required)) {
                throw ConfigError(std::string("Missing required option --") + required);
            }
        }

        addresses = result["es_address"].as<std::vector<std::string>>();
        cfg.indices = result["indices"].as<int>();
        cfg.documents = result["documents"].as<int>();
        cfg.clients = result["clients"].as<int>();
        cfg.seconds = result["seconds"].as<int>();
        cfg.use_https = result.count("use_https") > 0;
        cfg.credentials.username = result["username"].as<std::string>();
        cfg.credentials.password = result["password"].as<std::string>();
        cfg.shards.number_of_shards = result["number-of-shards"].as<int>();
        cfg.shards.number_of_replicas = result["number-of-replicas"].as<int>();
        cfg.bulk_size = result["bulk-size"].as<int>();
        cfg.max_fields_per_document = result["max-fields-per-document"].as<int>();
        cfg.max_size_per_field = result["max-size-per-field"].as<int>();
        cfg.no_cleanup = result.count("no-cleanup") > 0;
        cfg.stats_frequency = result["stats-frequency"].as<int>();
        cfg.wait_for_green = result.count("not-green") == 0;
        cfg.health_timeout = result["health-timeout"].as<int>();
        cfg.seed = result["seed"].as<int>();
        cfg.results_file = result["results-file"].as<std::string>();
    } catch (const ConfigError&) {
        throw;
    } catch (const std::exception& e) {
        throw ConfigError(std::string("Error parsing arguments: ") + e.what());
    }

    cfg.endpoints = parse_endpoints(addresses);
    cfg.Validate();
    return cmd;
}
