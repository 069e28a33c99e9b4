#include "provisioner.hpp"

#include "errors.hpp"

#include <algorithm>

ResourceProvisioner::ResourceProvisioner(IStoreClient& client, ConsoleSink& console, Seed seed)
    : client_(client), console_(console) {
    seed_engine(gen_, seed);
}

std::vector<std::string> ResourceProvisioner::CreateContainers(int n, const ShardConfig& shards) {
    std::vector<std::string> names;
    names.reserve(n > 0 ? static_cast<size_t>(n) : 0);

    for (int i = 0; i < n; ++i) {
        std::string name = fixed_lowercase_string(gen_, kIndexNameLength);
        names.push_back(name);
        try {
            client_.CreateContainer(name, shards);
        } catch (const StoreError& e) {
            console_.Error("[Provisioner] Could not create index " + name + ". Is your cluster ok? (" +
                           e.what() + ")");
        }
    }
    return names;
}

bool ResourceProvisioner::WaitUntilHealthy(int timeout_sec, const std::function<bool()>& interrupted) {
    int remaining = timeout_sec;
    do {
        int slice = std::min(remaining, kHealthSliceSec);
        try {
            client_.WaitHealthy(slice);
            return true;
        } catch (const HealthTimeoutError& e) {
            remaining -= slice;
            if (remaining <= 0) {
                console_.Error(std::string("[Provisioner] Cluster timeout: ") + e.what());
                return false;
            }
        } catch (const StoreError& e) {
            console_.Error(std::string("[Provisioner] Cluster timeout: ") + e.what());
            return false;
        }
        if (interrupted && interrupted()) {
            console_.Info("Interrupt received while waiting for the cluster, giving up on it");
            return false;
        }
    } while (remaining > 0);
    return false;
}

std::vector<std::string> ResourceProvisioner::DeleteContainers(const std::vector<std::string>& names) {
    std::vector<std::string> errors;
    for (const auto& name : names) {
        try {
            client_.DeleteContainer(name);
        } catch (const StoreError& e) {
            errors.push_back(name + ": " + e.what());
            console_.Error("[Provisioner] Could not delete index: " + name + ". Continue anyway.. (" +
                           e.what() + ")");
        }
    }
    return errors;
}
