#include <gtest/gtest.h>
#include "fake_store_client.h"
#include "provisioner.hpp"

#include <algorithm>
#include <sstream>

class ProvisionerTest : public ::testing::Test {
protected:
    ProvisionerTest()
        : store_(std::make_shared<FakeStore>()), client_(store_), console_(out_, err_),
          provisioner_(client_, console_, 23) {}

    std::shared_ptr<FakeStore> store_;
    FakeStoreClient client_;
    std::ostringstream out_;
    std::ostringstream err_;
    ConsoleSink console_;
    ResourceProvisioner provisioner_;
};

TEST_F(ProvisionerTest, CreatesRandomSixteenLetterNames) {
    auto names = provisioner_.CreateContainers(5, ShardConfig{});
    ASSERT_EQ(names.size(), 5u);
    for (const auto& n : names) {
        EXPECT_EQ(n.size(), static_cast<size_t>(ResourceProvisioner::kIndexNameLength));
        EXPECT_TRUE(std::all_of(n.begin(), n.end(), [](char c) { return c >= 'a' && c <= 'z'; }));
    }
    EXPECT_EQ(store_->Created(), names);
    EXPECT_EQ(store_->live_indices.size(), 5u);
}

TEST_F(ProvisionerTest, FailedCreateIsLoggedAndStillTracked) {
    store_->fail_create_all = true;
    auto names = provisioner_.CreateContainers(3, ShardConfig{});
    EXPECT_EQ(names.size(), 3u);
    EXPECT_EQ(store_->Created().size(), 3u);
    EXPECT_NE(err_.str().find("Could not create index"), std::string::npos);
}

TEST_F(ProvisionerTest, DeleteContinuesPastFailures) {
    auto names = provisioner_.CreateContainers(4, ShardConfig{});
    store_->fail_delete.insert(names[1]);

    auto errors = provisioner_.DeleteContainers(names);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].rfind(names[1], 0), 0u);
    EXPECT_EQ(store_->Deleted().size(), 3u);
    EXPECT_EQ(store_->live_indices.size(), 1u);
    EXPECT_NE(err_.str().find("Could not delete index: " + names[1]), std::string::npos);
}

TEST_F(ProvisionerTest, CleaningTwiceIsHarmless) {
    auto names = provisioner_.CreateContainers(2, ShardConfig{});
    EXPECT_TRUE(provisioner_.DeleteContainers(names).empty());
    EXPECT_TRUE(provisioner_.DeleteContainers(names).empty());
    EXPECT_TRUE(store_->live_indices.empty());
}

TEST_F(ProvisionerTest, HealthTimeoutReportsFalse) {
    EXPECT_TRUE(provisioner_.WaitUntilHealthy(5));
    store_->healthy = false;
    EXPECT_FALSE(provisioner_.WaitUntilHealthy(5));
    EXPECT_NE(err_.str().find("Cluster timeout"), std::string::npos);
}

TEST_F(ProvisionerTest, LongHealthWaitIsSplitIntoSlices) {
    store_->healthy = false;
    EXPECT_FALSE(provisioner_.WaitUntilHealthy(12));
    EXPECT_EQ(store_->health_timeouts, (std::vector<int>{5, 5, 2}));
}

TEST_F(ProvisionerTest, InterruptStopsHealthWaitBetweenSlices) {
    store_->healthy = false;
    auto interrupted = [this]() { return store_->health_checks >= 2; };
    EXPECT_FALSE(provisioner_.WaitUntilHealthy(600, interrupted));
    EXPECT_EQ(store_->health_checks, 2);
    EXPECT_NE(out_.str().find("Interrupt received while waiting for the cluster"), std::string::npos);
}
