#pragma once

#include "store_client.hpp"
#include "utils.h"

#include <functional>
#include <random>
#include <string>
#include <vector>

/**
 * @brief Creates and removes the randomly named indices a run writes to.
 *
 * All operations are best effort: a failing index is logged and the
 * remaining ones are still processed.
 */
class ResourceProvisioner {
public:
    static constexpr int kIndexNameLength = 16;
    // Longest single health request; interrupts are checked between them.
    static constexpr int kHealthSliceSec = 5;

    ResourceProvisioner(IStoreClient& client, ConsoleSink& console, Seed seed = std::nullopt);

    /**
     * @brief Creates n indices with random 16-letter names.
     * @return Every generated name, including those whose creation failed,
     * so that cleanup still attempts them.
     */
    std::vector<std::string> CreateContainers(int n, const ShardConfig& shards);

    /**
     * @brief Waits for green health in requests of at most kHealthSliceSec.
     * @return False if the store did not turn green within timeout_sec, or
     * if interrupted returned true between two requests.
     */
    bool WaitUntilHealthy(int timeout_sec, const std::function<bool()>& interrupted = nullptr);

    /**
     * @brief Deletes each index, continuing past failures.
     * @return One message per index that could not be deleted.
     */
    std::vector<std::string> DeleteContainers(const std::vector<std::string>& names);

private:
    IStoreClient& client_;
    ConsoleSink& console_;
    std::mt19937 gen_;
};
