#pragma once

#include "errors.hpp"
#include "store_client.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

// In-memory cluster shared by every FakeStoreClient created from it.
struct FakeStore {
    std::mutex mutex;
    std::set<std::string> live_indices;
    std::vector<std::string> created;
    std::vector<std::string> deleted;
    std::set<std::string> fail_create;
    std::set<std::string> fail_delete;
    bool fail_create_all = false;
    bool healthy = true;
    int health_checks = 0;
    std::vector<int> health_timeouts;

    std::atomic<long long> bulk_calls{0};
    std::atomic<long long> bulk_documents{0};
    // Every n-th bulk call fails (0 = never, 1 = always)
    std::atomic<int> fail_every{0};
    std::chrono::milliseconds bulk_latency{0};
    std::atomic<int> clients_made{0};

    std::vector<std::string> Created() {
        std::lock_guard<std::mutex> lock(mutex);
        return created;
    }

    std::vector<std::string> Deleted() {
        std::lock_guard<std::mutex> lock(mutex);
        return deleted;
    }
};

class FakeStoreClient : public IStoreClient {
public:
    explicit FakeStoreClient(std::shared_ptr<FakeStore> store) : store_(std::move(store)) {}

    void CreateContainer(const std::string& name, const ShardConfig&) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        store_->created.push_back(name);
        if (store_->fail_create_all || store_->fail_create.count(name)) {
            throw StoreError("create refused: " + name);
        }
        store_->live_indices.insert(name);
    }

    void DeleteContainer(const std::string& name) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        if (store_->fail_delete.count(name)) {
            throw StoreError("delete refused: " + name);
        }
        store_->deleted.push_back(name);
        // Missing index is not an error
        store_->live_indices.erase(name);
    }

    void WaitHealthy(int timeout_sec) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        store_->health_checks++;
        store_->health_timeouts.push_back(timeout_sec);
        if (!store_->healthy) {
            throw HealthTimeoutError("still yellow after " + std::to_string(timeout_sec) + "s");
        }
    }

    size_t BulkWrite(const Batch& batch) override {
        if (store_->bulk_latency.count() > 0) {
            std::this_thread::sleep_for(store_->bulk_latency);
        }
        long long n = ++store_->bulk_calls;
        int every = store_->fail_every.load();
        if (every > 0 && n % every == 0) {
            throw StoreError("bulk rejected");
        }
        size_t bytes = 0;
        for (const auto& item : batch) {
            bytes += item.index->size() + item.document->json.size();
        }
        store_->bulk_documents += static_cast<long long>(batch.size());
        return bytes;
    }

private:
    std::shared_ptr<FakeStore> store_;
};

inline StoreClientFactory fake_factory(const std::shared_ptr<FakeStore>& store) {
    return [store]() -> std::unique_ptr<IStoreClient> {
        store->clients_made++;
        return std::make_unique<FakeStoreClient>(store);
    };
}
