#pragma once

#include "utils.h"

#include <map>
#include <random>
#include <string>
#include <vector>

// Field name -> field value. Field order carries no meaning.
using Document = std::map<std::string, std::string>;

/**
 * @brief A generated document together with its rendered JSON body.
 * Rendering once up front keeps serialization out of the worker loop.
 */
struct PooledDocument {
    Document fields;
    std::string json;
};

// Read-only after construction; shared by every worker without locking.
using DocumentPool = std::vector<PooledDocument>;

std::string document_to_json(const Document& doc);

/**
 * @brief Produces random documents made of lowercase keys and values.
 *
 * Not thread-safe: the pool is built once on the orchestrating thread
 * before any worker starts.
 */
class DocumentGenerator {
public:
    static constexpr int kMaxKeyLength = 10;
    static constexpr int kVariantCount = 10;

    explicit DocumentGenerator(Seed seed = std::nullopt);

    /**
     * @brief Generates one document.
     * @param max_fields     Upper bound of the field count, at least 1.
     * @param max_field_size Upper bound of a value length, at least 1.
     * @throws ConfigError if either bound is below 1.
     */
    Document Generate(int max_fields, int max_field_size);

    /**
     * @brief Builds the shared pool: count base documents followed by
     * kVariantCount variants. A variant copies a random base document and
     * re-randomizes each value, so the set of field shapes does not grow.
     * @throws ConfigError if count, max_fields or max_field_size is below 1.
     */
    DocumentPool BuildPool(int count, int max_fields, int max_field_size);

private:
    static void CheckBounds(int max_fields, int max_field_size);

    std::mt19937 gen_;
};
