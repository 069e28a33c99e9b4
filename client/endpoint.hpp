#pragma once

#include <string>
#include <vector>

constexpr int kDefaultStorePort = 9200;

/**
 * @brief One target cluster: a group of client nodes reached on one port.
 */
struct Endpoint {
    std::vector<std::string> hosts;
    int port = kDefaultStorePort;

    std::string ToString() const;
};

/**
 * @brief Parses "host[:port][,host[:port]...]".
 *
 * Hosts without a port use kDefaultStorePort. Every host in the group
 * must resolve to the same port.
 * @throws ConfigError on an empty or malformed host, or mismatched ports.
 */
Endpoint parse_endpoint(const std::string& address);

std::vector<Endpoint> parse_endpoints(const std::vector<std::string>& addresses);
