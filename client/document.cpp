#include "document.hpp"

#include "errors.hpp"
#include "utils.h"

#include <sstream>

std::string document_to_json(const Document& doc) {
    // Keys and values are generated from [a-z] only, nothing needs escaping.
    std::ostringstream ss;
    ss << "{";
    bool first = true;
    for (const auto& field : doc) {
        if (!first) ss << ",";
        first = false;
        ss << "\"" << field.first << "\":\"" << field.second << "\"";
    }
    ss << "}";
    return ss.str();
}

DocumentGenerator::DocumentGenerator(Seed seed) {
    seed_engine(gen_, seed);
}

void DocumentGenerator::CheckBounds(int max_fields, int max_field_size) {
    if (max_fields < 1) {
        throw ConfigError("Max fields per document must be at least 1, got " + std::to_string(max_fields));
    }
    if (max_field_size < 1) {
        throw ConfigError("Max size per field must be at least 1, got " + std::to_string(max_field_size));
    }
}

Document DocumentGenerator::Generate(int max_fields, int max_field_size) {
    CheckBounds(max_fields, max_field_size);

    std::uniform_int_distribution<int> field_count(1, max_fields);
    int n = field_count(gen_);

    Document doc;
    for (int i = 0; i < n; ++i) {
        // A duplicate key overwrites the earlier field
        doc[random_lowercase_string(gen_, kMaxKeyLength)] = random_lowercase_string(gen_, max_field_size);
    }
    return doc;
}

DocumentPool DocumentGenerator::BuildPool(int count, int max_fields, int max_field_size) {
    CheckBounds(max_fields, max_field_size);
    if (count < 1) {
        throw ConfigError("Number of documents must be at least 1, got " + std::to_string(count));
    }

    DocumentPool pool;
    pool.reserve(static_cast<size_t>(count) + kVariantCount);

    for (int i = 0; i < count; ++i) {
        Document doc = Generate(max_fields, max_field_size);
        std::string json = document_to_json(doc);
        pool.push_back(PooledDocument{std::move(doc), std::move(json)});
    }

    std::uniform_int_distribution<size_t> pick(0, static_cast<size_t>(count) - 1);
    for (int i = 0; i < kVariantCount; ++i) {
        Document variant = pool[pick(gen_)].fields;
        for (auto& field : variant) {
            field.second = random_lowercase_string(gen_, max_field_size);
        }
        std::string json = document_to_json(variant);
        pool.push_back(PooledDocument{std::move(variant), std::move(json)});
    }
    return pool;
}
