#pragma once

#include "../errors.hpp"
#include "../workload.hpp"

#include <string>
#include <vector>

/**
 * @brief Indexes bulk_size documents per request, each drawn uniformly
 * (with replacement) from the shared pool and sent to a uniformly drawn
 * index of the endpoint.
 */
class BulkIndexWorkload : public IWorkload {
    std::shared_ptr<const std::vector<std::string>> indices_;
    std::shared_ptr<const DocumentPool> documents_;
    int bulk_size_;
    std::uniform_int_distribution<size_t> index_dist_;
    std::uniform_int_distribution<size_t> document_dist_;
    Batch batch_;
public:
    BulkIndexWorkload(std::shared_ptr<const std::vector<std::string>> indices,
                      std::shared_ptr<const DocumentPool> documents,
                      int bulk_size)
        : indices_(std::move(indices)), documents_(std::move(documents)), bulk_size_(bulk_size) {
        if (!indices_ || indices_->empty()) {
            throw ConfigError("Bulk workload needs at least one index");
        }
        if (!documents_ || documents_->empty()) {
            throw ConfigError("Bulk workload needs at least one document");
        }
        if (bulk_size_ < 1) {
            throw ConfigError("Bulk size must be at least 1");
        }
        index_dist_ = std::uniform_int_distribution<size_t>(0, indices_->size() - 1);
        document_dist_ = std::uniform_int_distribution<size_t>(0, documents_->size() - 1);
    }

    size_t Execute(IStoreClient& client, std::mt19937& gen) override {
        batch_.clear();
        batch_.reserve(static_cast<size_t>(bulk_size_));
        for (int i = 0; i < bulk_size_; ++i) {
            batch_.push_back(BatchItem{&(*indices_)[index_dist_(gen)], &(*documents_)[document_dist_(gen)]});
        }
        return client.BulkWrite(batch_);
    }

    std::unique_ptr<IWorkload> Clone() const override {
        return std::make_unique<BulkIndexWorkload>(*this);
    }
};
