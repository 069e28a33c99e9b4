#include <gtest/gtest.h>
#include "document.hpp"
#include "errors.hpp"

#include <algorithm>
#include <set>

namespace {
    bool all_lowercase(const std::string& s) {
        return std::all_of(s.begin(), s.end(), [](char c) { return c >= 'a' && c <= 'z'; });
    }

    std::set<std::string> keys_of(const Document& doc) {
        std::set<std::string> keys;
        for (const auto& field : doc) keys.insert(field.first);
        return keys;
    }
}

TEST(DocumentGeneratorTest, FieldCountStaysWithinBounds) {
    DocumentGenerator gen(42);
    for (int max_fields : {1, 2, 7, 50}) {
        for (int i = 0; i < 200; ++i) {
            Document doc = gen.Generate(max_fields, 20);
            ASSERT_GE(doc.size(), 1u);
            ASSERT_LE(doc.size(), static_cast<size_t>(max_fields));
        }
    }
}

TEST(DocumentGeneratorTest, KeysAndValuesAreLowercaseAndBounded) {
    DocumentGenerator gen(7);
    for (int i = 0; i < 100; ++i) {
        Document doc = gen.Generate(10, 30);
        for (const auto& field : doc) {
            EXPECT_GE(field.first.size(), 1u);
            EXPECT_LE(field.first.size(), static_cast<size_t>(DocumentGenerator::kMaxKeyLength));
            EXPECT_GE(field.second.size(), 1u);
            EXPECT_LE(field.second.size(), 30u);
            EXPECT_TRUE(all_lowercase(field.first));
            EXPECT_TRUE(all_lowercase(field.second));
        }
    }
}

TEST(DocumentGeneratorTest, ZeroMaxFieldsIsAConfigError) {
    DocumentGenerator gen(1);
    EXPECT_THROW(gen.Generate(0, 10), ConfigError);
    EXPECT_THROW(gen.Generate(5, 0), ConfigError);
}

TEST(DocumentGeneratorTest, BuildPoolRejectsBadBoundsUpFront) {
    DocumentGenerator gen(1);
    EXPECT_THROW(gen.BuildPool(10, 0, 10), ConfigError);
    EXPECT_THROW(gen.BuildPool(10, 5, 0), ConfigError);
    EXPECT_THROW(gen.BuildPool(0, 5, 10), ConfigError);
}

TEST(DocumentGeneratorTest, PoolHasBaseDocumentsPlusVariants) {
    DocumentGenerator gen(3);
    DocumentPool pool = gen.BuildPool(5, 8, 16);
    ASSERT_EQ(pool.size(), 5u + DocumentGenerator::kVariantCount);

    // Every variant reuses the field set of one of the base documents
    for (size_t v = 5; v < pool.size(); ++v) {
        auto variant_keys = keys_of(pool[v].fields);
        bool matched = false;
        for (size_t b = 0; b < 5 && !matched; ++b) {
            matched = keys_of(pool[b].fields) == variant_keys;
        }
        EXPECT_TRUE(matched) << "variant " << v << " has a new field shape";
    }
}

TEST(DocumentGeneratorTest, PooledJsonMatchesFields) {
    DocumentGenerator gen(11);
    DocumentPool pool = gen.BuildPool(3, 4, 8);
    for (const auto& doc : pool) {
        EXPECT_EQ(doc.json, document_to_json(doc.fields));
    }
}

TEST(DocumentGeneratorTest, SameSeedSameDocuments) {
    DocumentGenerator a(99);
    DocumentGenerator b(99);
    EXPECT_EQ(a.Generate(20, 50), b.Generate(20, 50));
}

TEST(SeedTest, DerivedSeedWrapsAround) {
    EXPECT_EQ(derive_seed(Seed(0xFFFFFFFFu), 2u), Seed(1u));
    EXPECT_EQ(derive_seed(Seed(10u), 5u), Seed(15u));
    EXPECT_FALSE(derive_seed(std::nullopt, 5u).has_value());
}

TEST(DocumentJsonTest, RendersFlatObject) {
    Document doc{{"abc", "xyz"}, {"k", "v"}};
    EXPECT_EQ(document_to_json(doc), "{\"abc\":\"xyz\",\"k\":\"v\"}");
    EXPECT_EQ(document_to_json(Document{}), "{}");
}
