#pragma once

#include "document.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

struct ShardConfig {
    int number_of_shards = 3;
    int number_of_replicas = 1;
};

// One document destined for one index. Both pointers refer to shared,
// read-only run state that outlives the batch.
struct BatchItem {
    const std::string* index;
    const PooledDocument* document;
};

using Batch = std::vector<BatchItem>;

/**
 * @brief The operations the load harness needs from the target store.
 *
 * Every failure is reported by throwing StoreError (or HealthTimeoutError
 * from WaitHealthy). An instance is used by one thread at a time; each
 * worker receives its own instance from a StoreClientFactory.
 */
class IStoreClient {
public:
    virtual ~IStoreClient() = default;

    virtual void CreateContainer(const std::string& name, const ShardConfig& shards) = 0;

    /**
     * @brief Deletes an index. Deleting an index that does not exist
     * succeeds.
     */
    virtual void DeleteContainer(const std::string& name) = 0;

    /**
     * @brief Blocks until the store reports green health.
     * @throws HealthTimeoutError when the timeout elapses first.
     */
    virtual void WaitHealthy(int timeout_sec) = 0;

    /**
     * @brief Submits the whole batch as one write. The batch either
     * succeeds as a unit or throws.
     * @return The number of bytes submitted.
     */
    virtual size_t BulkWrite(const Batch& batch) = 0;
};

using StoreClientFactory = std::function<std::unique_ptr<IStoreClient>()>;
