#include "endpoint.hpp"

#include "errors.hpp"

#include <regex>
#include <sstream>

namespace {
    const std::regex kHostWithPort("([a-zA-Z_0-9.-]+):(\\d+)");
    const std::regex kHostOnly("[a-zA-Z_0-9.-]+");

    std::vector<std::string> split(const std::string& s, char sep) {
        std::vector<std::string> parts;
        std::string part;
        std::istringstream in(s);
        while (std::getline(in, part, sep)) {
            parts.push_back(part);
        }
        // getline drops a trailing empty field
        if (!s.empty() && s.back() == sep) {
            parts.emplace_back();
        }
        return parts;
    }
}

std::string Endpoint::ToString() const {
    std::ostringstream ss;
    for (size_t i = 0; i < hosts.size(); ++i) {
        if (i > 0) ss << ",";
        ss << hosts[i];
    }
    ss << " (port " << port << ")";
    return ss.str();
}

Endpoint parse_endpoint(const std::string& address) {
    Endpoint endpoint;
    int group_port = -1;

    for (const auto& item : split(address, ',')) {
        std::smatch match;
        int port = kDefaultStorePort;
        if (std::regex_match(item, match, kHostWithPort)) {
            endpoint.hosts.push_back(match[1].str());
            try {
                port = std::stoi(match[2].str());
            } catch (const std::out_of_range&) {
                throw ConfigError("Port out of range in '" + address + "'");
            }
            if (port < 1 || port > 65535) {
                throw ConfigError("Port out of range in '" + address + "'");
            }
        } else if (std::regex_match(item, kHostOnly)) {
            endpoint.hosts.push_back(item);
        } else {
            throw ConfigError("Error parsing address string '" + address + "'");
        }

        if (group_port != -1 && port != group_port) {
            throw ConfigError("Ports in '" + address + "' don't match");
        }
        group_port = port;
    }

    if (endpoint.hosts.empty()) {
        throw ConfigError("Empty address string");
    }
    endpoint.port = group_port;
    return endpoint;
}

std::vector<Endpoint> parse_endpoints(const std::vector<std::string>& addresses) {
    std::vector<Endpoint> endpoints;
    endpoints.reserve(addresses.size());
    for (const auto& address : addresses) {
        endpoints.push_back(parse_endpoint(address));
    }
    return endpoints;
}
