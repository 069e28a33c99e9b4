#include <iostream>
#include <string>
#include <exception>

#include "errors.hpp"
#include "es_client.hpp"
#include "orchestrator.hpp"
#include "run_config.hpp"
#include "shutdown.hpp"
#include "TestResults.hpp"
#include "utils.h"

int main(int argc, char* argv[]) {
    CommandLine cmd;
    try {
        cmd = parse_command_line(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << "\n"
                  << "Usage: " << argv[0]
                  << " --es_address <host[:port][,host[:port]]>... --indices <n> --documents <n>"
                  << " --clients <n> --seconds <n> [options]\n"
                  << "Run with --help for all options.\n";
        return 1;
    }

    if (cmd.show_help) {
        std::cout << cmd.help << "\n";
        return 0;
    }

    const RunConfig& cfg = cmd.config;
    ConsoleSink console(std::cout, std::cerr);
    InterruptWatcher::Install();

    RunSummary summary;
    try {
        auto factory = [&cfg](const Endpoint& endpoint) {
            return make_elastic_factory(endpoint, cfg.use_https, cfg.credentials);
        };
        Orchestrator orchestrator(cfg, factory, console, &InterruptWatcher::Triggered);
        summary = orchestrator.Run();
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Got unexpected exception. probably a bug, please report it.\n\n"
                  << e.what() << "\n\n";
        return 1;
    }

    for (const auto& err : summary.cleanup_errors) {
        std::cerr << "Leftover index " << err << "\n";
    }

    if (!cfg.results_file.empty()) {
        TestResult tr{static_cast<int>(cfg.endpoints.size()),
                      cfg.clients,
                      cfg.seconds,
                      summary.stats.success_bulks,
                      summary.stats.failed_bulks,
                      summary.stats.success_documents,
                      summary.stats.failed_documents,
                      summary.stats.megabytes,
                      summary.stats.megabytes_per_sec,
                      summary.outcome == RunOutcome::Interrupted};
        append_result_to_file(tr, cfg.results_file);
        std::cout << "Results written to '" << cfg.results_file << "'\n";
    }

    return exit_status(summary);
}
