#include <gtest/gtest.h>
#include "catalog/CatalogStore.hpp"

#include <filesystem>

using namespace vc::catalog;
using vc::database::UsageState;

class UsageRefreshTest : public ::testing::Test {
protected:
    vc::config::CatalogConfig cfg;

    void SetUp() override {
        cfg.usage_refresh_events = 100;
        cfg.usage_refresh_interval = std::chrono::seconds(300);
    }
};

TEST_F(UsageRefreshTest, NeverRefreshedIsDue) {
    UsageState s;
    s.events_since_refresh = 1;
    EXPECT_TRUE(usageRefreshDue(s, 1000, cfg));
}

TEST_F(UsageRefreshTest, EventThresholdTriggers) {
    UsageState s;
    s.usage_refreshed_at = 1000;
    s.events_since_refresh = 99;
    EXPECT_FALSE(usageRefreshDue(s, 1010, cfg));
    s.events_since_refresh = 100;
    EXPECT_TRUE(usageRefreshDue(s, 1010, cfg));
}

TEST_F(UsageRefreshTest, AgeThresholdTriggers) {
    UsageState s;
    s.usage_refreshed_at = 1000;
    s.events_since_refresh = 1;
    EXPECT_FALSE(usageRefreshDue(s, 1299, cfg));
    EXPECT_TRUE(usageRefreshDue(s, 1300, cfg));
}

TEST(ProbeDiskUsage, ReportsTempDirAndFailsOnMissing) {
    const auto usage = probeDiskUsage(std::filesystem::temp_directory_path());
    ASSERT_TRUE(usage.has_value());
    EXPECT_GT(usage->total_bytes, 0);
    EXPECT_LE(usage->used_bytes, usage->total_bytes);

    EXPECT_FALSE(probeDiskUsage("/definitely/not/here/volcat").has_value());
}
