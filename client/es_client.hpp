#pragma once

#include "endpoint.hpp"
#include "run_config.hpp"
#include "store_client.hpp"

#include <httplib.h>

#include <memory>
#include <string>
#include <vector>

/**
 * @brief IStoreClient over the Elasticsearch REST API.
 *
 * Holds one persistent HTTP connection per host of the endpoint and
 * spreads requests over them round-robin. Not thread-safe; create one
 * per worker through make_elastic_factory().
 */
class ElasticClient : public IStoreClient {
public:
    ElasticClient(const Endpoint& endpoint, bool use_https, const Credentials& credentials);

    void CreateContainer(const std::string& name, const ShardConfig& shards) override;
    void DeleteContainer(const std::string& name) override;
    void WaitHealthy(int timeout_sec) override;
    size_t BulkWrite(const Batch& batch) override;

    // Newline-delimited action/document pairs as POSTed to /_bulk.
    static std::string BuildBulkBody(const Batch& batch);

private:
    httplib::Client& NextHost();

    std::vector<std::unique_ptr<httplib::Client>> hosts_;
    size_t next_host_ = 0;
};

StoreClientFactory make_elastic_factory(const Endpoint& endpoint, bool use_https, const Credentials& credentials);
