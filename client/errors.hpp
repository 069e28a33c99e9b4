#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Invalid run configuration (bounds, addresses, options).
 * Always raised before any load is generated.
 */
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief A failed call against the target store (create, delete, bulk write).
 */
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

// The store did not report green status within the allotted time.
class HealthTimeoutError : public StoreError {
public:
    explicit HealthTimeoutError(const std::string& what) : StoreError(what) {}
};
