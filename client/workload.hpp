#pragma once

#include "store_client.hpp"

#include <memory>
#include <random>

/**
 * @brief Abstract interface for one unit of load (one bulk request).
 *
 * Each worker thread receives its own clone of a workload object,
 * allowing it to keep per-thread state (distributions, scratch buffers)
 * without needing locks.
 */
class IWorkload {
public:
    virtual ~IWorkload() = default;

    /**
     * @brief Executes a single operation against the store.
     * @param client The store client dedicated to this thread.
     * @param gen    The random number generator dedicated to this thread.
     * @return Bytes submitted.
     * @throws StoreError if the operation failed.
     */
    virtual size_t Execute(IStoreClient& client, std::mt19937& gen) = 0;

    /**
     * @brief Creates a deep copy of the workload object.
     */
    virtual std::unique_ptr<IWorkload> Clone() const = 0;
};
