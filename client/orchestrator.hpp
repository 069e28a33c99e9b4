#pragma once

#include "endpoint.hpp"
#include "run_config.hpp"
#include "run_stats.hpp"
#include "shutdown.hpp"
#include "store_client.hpp"
#include "utils.h"
#include "worker_pool.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

enum class RunState {
    Initializing,
    Provisioning,
    AwaitingHealth,
    Running,
    Draining,
    Cleanup,
    Done,
};

enum class RunOutcome {
    Completed,
    Interrupted,
};

struct RunSummary {
    RunOutcome outcome = RunOutcome::Completed;
    DerivedStats stats;
    int endpoints_run = 0;
    std::vector<std::string> cleanup_errors;
};

// 128 + SIGINT, the conventional status of a run stopped by Ctrl-C
constexpr int kInterruptedExitCode = 130;

// Process exit status for a finished run.
int exit_status(const RunSummary& summary);

// Builds the client factory used for one endpoint (admin client and workers).
using EndpointClientFactory = std::function<StoreClientFactory(const Endpoint&)>;

// Polled while the run is in progress; true requests a graceful stop.
using InterruptProbe = std::function<bool()>;

/**
 * @brief Drives one complete stress run over every configured endpoint.
 *
 * Provisioning and the health check run endpoint by endpoint. An endpoint
 * that never turns green is cleaned right away and gets no workers; the
 * others start together and share one deadline and one set of counters.
 */
class Orchestrator {
public:
    static constexpr std::chrono::milliseconds kPollInterval{100};

    Orchestrator(RunConfig config, EndpointClientFactory client_factory, ConsoleSink& console,
                 InterruptProbe interrupted);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * @brief Runs to completion. Call once.
     * @throws ConfigError if the configuration is invalid; nothing is
     * provisioned in that case.
     */
    RunSummary Run();

    RunState state() const { return state_; }
    const std::vector<RunState>& history() const { return history_; }

    // Index names created for endpoint i (empty before provisioning).
    std::vector<std::string> IndicesOf(size_t endpoint) const;

private:
    struct EndpointRun {
        Endpoint endpoint;
        StoreClientFactory factory;
        std::unique_ptr<IStoreClient> admin;
        std::shared_ptr<const std::vector<std::string>> indices;
        std::unique_ptr<WorkerPool> pool;
        bool cleaned = false;
    };

    void SetState(RunState state);
    void Prepare(EndpointRun& run, size_t ordinal);
    void Drain();
    void Cleanup(EndpointRun& run, std::vector<std::string>& errors);
    Seed SeedFor(size_t ordinal, uint32_t stream) const;

    RunConfig config_;
    EndpointClientFactory client_factory_;
    ConsoleSink& console_;
    InterruptProbe interrupted_;

    std::shared_ptr<RunStats> stats_;
    ShutdownSignal shutdown_;
    std::vector<EndpointRun> runs_;

    RunState state_ = RunState::Initializing;
    std::vector<RunState> history_;
};
