#include "es_client.hpp"

#include "errors.hpp"

#include <sstream>

namespace {
    std::string describe(const httplib::Result& res) {
        if (!res) {
            return "request failed: " + httplib::to_string(res.error());
        }
        std::string body = res->body.substr(0, 200);
        return "HTTP " + std::to_string(res->status) + " " + body;
    }

    bool is_success(const httplib::Result& res) {
        return res && res->status >= 200 && res->status < 300;
    }
}

ElasticClient::ElasticClient(const Endpoint& endpoint, bool use_https, const Credentials& credentials) {
    if (endpoint.hosts.empty()) {
        throw ConfigError("Endpoint has no hosts");
    }
    const std::string scheme = use_https ? "https" : "http";

    for (const auto& host : endpoint.hosts) {
        auto cli = std::make_unique<httplib::Client>(scheme + "://" + host + ":" + std::to_string(endpoint.port));
        if (!cli->is_valid()) {
            throw ConfigError("Cannot create " + scheme + " client for " + host +
                              (use_https ? " (built without TLS support?)" : ""));
        }
        cli->set_keep_alive(true);
        cli->set_tcp_nodelay(true);
        cli->set_connection_timeout(5);
        cli->set_read_timeout(120);
        if (!credentials.username.empty()) {
            cli->set_basic_auth(credentials.username, credentials.password);
        }
        hosts_.push_back(std::move(cli));
    }
}

httplib::Client& ElasticClient::NextHost() {
    httplib::Client& cli = *hosts_[next_host_];
    next_host_ = (next_host_ + 1) % hosts_.size();
    return cli;
}

void ElasticClient::CreateContainer(const std::string& name, const ShardConfig& shards) {
    std::ostringstream body;
    body << "{\"settings\":{\"number_of_shards\":" << shards.number_of_shards
         << ",\"number_of_replicas\":" << shards.number_of_replicas << "}}";

    auto res = NextHost().Put("/" + name, body.str(), "application/json");
    if (!is_success(res)) {
        throw StoreError("create index " + name + ": " + describe(res));
    }
}

void ElasticClient::DeleteContainer(const std::string& name) {
    auto res = NextHost().Delete("/" + name);
    // 404: already gone, 400: never created
    if (res && (res->status == 400 || res->status == 404)) {
        return;
    }
    if (!is_success(res)) {
        throw StoreError("delete index " + name + ": " + describe(res));
    }
}

void ElasticClient::WaitHealthy(int timeout_sec) {
    httplib::Client& cli = NextHost();
    // The server holds the request up to the timeout, keep reading past it
    cli.set_read_timeout(timeout_sec + 30);

    const std::string t = std::to_string(timeout_sec) + "s";
    auto res = cli.Get("/_cluster/health?wait_for_status=green&timeout=" + t + "&master_timeout=" + t);
    cli.set_read_timeout(120);

    if (!res || res->status != 200 || res->body.find("\"timed_out\":false") == std::string::npos) {
        throw HealthTimeoutError("cluster not green after " + t + ": " + describe(res));
    }
}

std::string ElasticClient::BuildBulkBody(const Batch& batch) {
    std::string body;
    for (const auto& item : batch) {
        body += "{\"index\":{\"_index\":\"";
        body += *item.index;
        body += "\"}}\n";
        body += item.document->json;
        body += '\n';
    }
    return body;
}

size_t ElasticClient::BulkWrite(const Batch& batch) {
    std::string body = BuildBulkBody(batch);
    auto res = NextHost().Post("/_bulk", body, "application/x-ndjson");
    if (!is_success(res)) {
        throw StoreError("bulk: " + describe(res));
    }
    // A 200 reply can still carry per-item rejections
    if (res->body.find("\"errors\":true") != std::string::npos) {
        throw StoreError("bulk: some items were rejected");
    }
    return body.size();
}

StoreClientFactory make_elastic_factory(const Endpoint& endpoint, bool use_https, const Credentials& credentials) {
    return [endpoint, use_https, credentials]() -> std::unique_ptr<IStoreClient> {
        return std::make_unique<ElasticClient>(endpoint, use_https, credentials);
    };
}
