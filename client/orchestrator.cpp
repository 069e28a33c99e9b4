#include "orchestrator.hpp"

#include "document.hpp"
#include "errors.hpp"
#include "provisioner.hpp"
#include "reporter.hpp"
#include "workloads/bulk_index_workload.hpp"

#include <sstream>

Orchestrator::Orchestrator(RunConfig config, EndpointClientFactory client_factory, ConsoleSink& console,
                           InterruptProbe interrupted)
    : config_(std::move(config)), client_factory_(std::move(client_factory)), console_(console),
      interrupted_(std::move(interrupted)), stats_(std::make_shared<RunStats>()) {
    if (!interrupted_) {
        interrupted_ = []() { return false; };
    }
    history_.push_back(state_);
}

Orchestrator::~Orchestrator() {
    // Never leave threads blocked on a deadline that is still far away
    shutdown_.Set();
}

void Orchestrator::SetState(RunState state) {
    if (state_ == state) return;
    state_ = state;
    history_.push_back(state);
}

Seed Orchestrator::SeedFor(size_t ordinal, uint32_t stream) const {
    if (config_.seed == -1) return std::nullopt;
    uint32_t offset = static_cast<uint32_t>(ordinal) * 10007u + stream * 1000003u;
    return derive_seed(static_cast<uint32_t>(config_.seed), offset);
}

int exit_status(const RunSummary& summary) {
    return summary.outcome == RunOutcome::Interrupted ? kInterruptedExitCode : 0;
}

std::vector<std::string> Orchestrator::IndicesOf(size_t endpoint) const {
    if (endpoint >= runs_.size() || !runs_[endpoint].indices) return {};
    return *runs_[endpoint].indices;
}

void Orchestrator::Prepare(EndpointRun& run, size_t ordinal) {
    SetState(RunState::Provisioning);
    console_.Info("\nStarting initialization of " + run.endpoint.ToString());

    run.factory = client_factory_(run.endpoint);
    run.admin = run.factory();

    console_.Info("Generating documents..");
    DocumentGenerator generator(SeedFor(ordinal, 0));
    auto documents = std::make_shared<const DocumentPool>(
        generator.BuildPool(config_.documents, config_.max_fields_per_document, config_.max_size_per_field));
    console_.Info("Done!");

    console_.Info("Creating indices.. ");
    ResourceProvisioner provisioner(*run.admin, console_, SeedFor(ordinal, 1));
    run.indices = std::make_shared<const std::vector<std::string>>(
        provisioner.CreateContainers(config_.indices, config_.shards));

    if (config_.wait_for_green) {
        SetState(RunState::AwaitingHealth);
        if (!provisioner.WaitUntilHealthy(config_.health_timeout, interrupted_)) {
            // Interrupted: the indices are removed in the regular cleanup phase
            if (interrupted_()) return;
            console_.Info("Cleaning up created indices.. ");
            std::vector<std::string> failed = provisioner.DeleteContainers(*run.indices);
            console_.Info("Skipping " + run.endpoint.ToString() + " (" + std::to_string(failed.size()) +
                          " indices could not be deleted)");
            run.cleaned = true;
            return;
        }
    }

    console_.Info("Generating workers.. ");
    BulkIndexWorkload workload(run.indices, documents, config_.bulk_size);
    run.pool = std::make_unique<WorkerPool>(config_.clients, run.factory, workload, stats_, shutdown_,
                                            SeedFor(ordinal, 2));
    console_.Info("Done!");
}

void Orchestrator::Drain() {
    if (state_ == RunState::Running) SetState(RunState::Draining);
    shutdown_.Set();
    for (auto& run : runs_) {
        if (run.pool) run.pool->Join();
    }
}

void Orchestrator::Cleanup(EndpointRun& run, std::vector<std::string>& errors) {
    if (run.cleaned || !run.indices) return;
    if (!run.admin) {
        run.admin = run.factory();
    }
    ResourceProvisioner provisioner(*run.admin, console_);
    std::vector<std::string> failed = provisioner.DeleteContainers(*run.indices);
    errors.insert(errors.end(), failed.begin(), failed.end());
    run.cleaned = true;
}

RunSummary Orchestrator::Run() {
    if (history_.size() > 1) {
        throw std::logic_error("Orchestrator::Run called twice");
    }
    config_.Validate();

    RunSummary summary;
    runs_.clear();
    for (const auto& endpoint : config_.endpoints) {
        EndpointRun run;
        run.endpoint = endpoint;
        runs_.push_back(std::move(run));
    }

    std::unique_ptr<StatsReporter> reporter;
    try {
        auto initialization_interrupted = [this, &summary]() {
            if (!interrupted_()) return false;
            console_.Info("Interrupt received during initialization, skipping remaining endpoints");
            summary.outcome = RunOutcome::Interrupted;
            return true;
        };
        for (size_t i = 0; i < runs_.size(); ++i) {
            if (initialization_interrupted()) break;
            Prepare(runs_[i], i);
            if (runs_[i].pool) summary.endpoints_run++;
        }
        if (summary.outcome != RunOutcome::Interrupted) initialization_interrupted();

        Deadline deadline = Deadline::FromNow(std::chrono::seconds(config_.seconds));
        stats_->MarkStart(deadline.start());

        if (summary.endpoints_run > 0 && summary.outcome != RunOutcome::Interrupted) {
            SetState(RunState::Running);
            std::ostringstream banner;
            banner << "Starting the test. Will print stats every " << config_.stats_frequency << " seconds.\n"
                   << "The test would run for " << config_.seconds << " seconds, but it might take a bit more "
                   << "because we are waiting for current bulk operation to complete.\n";
            console_.Info(banner.str());

            reporter = std::make_unique<StatsReporter>(stats_, config_.bulk_size, shutdown_, console_,
                                                       std::chrono::seconds(config_.stats_frequency));
            for (auto& run : runs_) {
                if (run.pool) run.pool->Start(deadline);
            }
            reporter->Start(deadline);

            for (auto& run : runs_) {
                if (!run.pool) continue;
                while (!run.pool->WaitFor(kPollInterval)) {
                    if (summary.outcome != RunOutcome::Interrupted && interrupted_()) {
                        console_.Info("\nCtrl-c received! Sending kill to threads...");
                        summary.outcome = RunOutcome::Interrupted;
                        SetState(RunState::Draining);
                        shutdown_.Set();
                    }
                }
            }
        }
    } catch (...) {
        // Stop whatever already started, remove what was created, then report the fault
        Drain();
        if (reporter) reporter->Join();
        SetState(RunState::Cleanup);
        std::vector<std::string> errors;
        for (auto& run : runs_) {
            if (!run.factory || config_.no_cleanup) continue;
            try {
                Cleanup(run, errors);
            } catch (const std::exception& e) {
                console_.Error(std::string("[Orchestrator] Cleanup failed: ") + e.what());
            }
        }
        throw;
    }

    Drain();
    if (reporter) reporter->Join();
    summary.stats = derive_stats(stats_->Snapshot(), config_.bulk_size);

    SetState(RunState::Cleanup);
    if (!config_.no_cleanup) {
        console_.Info("Cleaning up created indices.. ");
        for (auto& run : runs_) {
            if (run.factory) Cleanup(run, summary.cleanup_errors);
        }
        console_.Info("Done!");
    }

    SetState(RunState::Done);
    console_.Raw("\nTest is done! Final results:\n" + format_stats(summary.stats));
    return summary;
}
