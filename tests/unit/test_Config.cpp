#include <gtest/gtest.h>
#include "config/Config.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <random>

namespace fs = std::filesystem;
using namespace vc::config;

class ConfigTest : public ::testing::Test {
protected:
    fs::path dir;
    fs::path file;

    void SetUp() override {
        dir = fs::temp_directory_path() / ("volcat_config_" + std::to_string(std::random_device{}()));
        fs::create_directories(dir);
        file = dir / "config.yaml";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void write(const std::string& yaml) const {
        std::ofstream out(file);
        out << yaml;
    }
};

TEST_F(ConfigTest, MissingFileYieldsDefaults) {
    const auto cfg = loadConfig(file);
    EXPECT_EQ(cfg.database.port, 5432);
    EXPECT_EQ(cfg.database.schema, "public");
    EXPECT_EQ(cfg.catalog.usage_refresh_events, 100u);
    EXPECT_EQ(cfg.catalog.usage_refresh_interval, std::chrono::seconds(300));
    EXPECT_TRUE(cfg.scanner.auto_scan);
    EXPECT_GE(cfg.scanner.max_scan_workers, 1u);   // 0 resolves to the core count
    EXPECT_FALSE(cfg.database.migrations_dir.empty());
    EXPECT_FALSE(cfg.logging.log_dir.empty());
}

TEST_F(ConfigTest, ReadsSectionsAndClampsPollInterval) {
    write("scanner:\n"
          "  max_scan_workers: 3\n"
          "  follow_symlinks: yes\n"
          "discovery:\n"
          "  roots: [/mnt, /media]\n"
          "  poll_interval_seconds: 0\n"
          "logging:\n"
          "  log_levels:\n"
          "    console_log_level: warning\n");

    const auto cfg = loadConfig(file);
    EXPECT_EQ(cfg.scanner.max_scan_workers, 3u);
    EXPECT_TRUE(cfg.scanner.follow_symlinks);
    ASSERT_EQ(cfg.discovery.roots.size(), 2u);
    EXPECT_EQ(cfg.discovery.roots[1], fs::path("/media"));
    EXPECT_EQ(cfg.discovery.poll_interval, std::chrono::seconds(1));
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::warn);
}

TEST_F(ConfigTest, RetryCountIsClampedBelowTheShiftWidth) {
    write("database:\n"
          "  max_retries: 40\n");
    EXPECT_EQ(loadConfig(file).database.max_retries, kMaxStoreRetries);

    write("database:\n"
          "  max_retries: 5\n");
    EXPECT_EQ(loadConfig(file).database.max_retries, 5u);
}

TEST_F(ConfigTest, MalformedFileRaisesConfigError) {
    write("scanner: [unclosed\n");
    EXPECT_THROW(loadConfig(file), ConfigError);

    write("scanner:\n  auto_scan: sometimes\n");
    EXPECT_THROW(loadConfig(file), ConfigError);

    write("- just\n- a list\n");
    EXPECT_THROW(loadConfig(file), ConfigError);
}

TEST_F(ConfigTest, SetGetUnsetRoundTrip) {
    EXPECT_EQ(setValue(file, "scanner.max_scan_workers", "4"), "4");
    EXPECT_EQ(getValue(file, "scanner.max_scan_workers"), "4");
    EXPECT_EQ(loadConfig(file).scanner.max_scan_workers, 4u);

    EXPECT_EQ(setValue(file, "discovery.roots", "/mnt, /media ,"), "/mnt,/media");
    EXPECT_EQ(loadConfig(file).discovery.roots.size(), 2u);

    unsetValue(file, "scanner.max_scan_workers");
    EXPECT_EQ(getValue(file, "scanner.max_scan_workers"), "0");
    EXPECT_EQ(getValue(file, "discovery.roots"), "/mnt,/media");
}

TEST_F(ConfigTest, SetRejectsUnknownKeysAndBadValues) {
    EXPECT_THROW(setValue(file, "scanner.turbo", "1"), ConfigError);
    EXPECT_THROW(setValue(file, "scanner.auto_scan", "sometimes"), ConfigError);
    EXPECT_THROW(getValue(file, "nope"), ConfigError);
    EXPECT_FALSE(fs::exists(file));
}

TEST_F(ConfigTest, UnsetOnMissingFileIsNoop) {
    EXPECT_NO_THROW(unsetValue(file, "scanner.auto_scan"));
    EXPECT_FALSE(fs::exists(file));
}

TEST_F(ConfigTest, SaveThenLoadKeepsValues) {
    Config cfg;
    cfg.database.schema = "catalog_test";
    cfg.watcher.recursive = false;
    cfg.catalog.ignore_names = {"desktop.ini"};
    cfg.save(file);

    const auto loaded = loadConfig(file);
    EXPECT_EQ(loaded.database.schema, "catalog_test");
    EXPECT_FALSE(loaded.watcher.recursive);
    EXPECT_EQ(loaded.catalog.ignore_names, std::vector<std::string>{"desktop.ini"});
}

TEST(ConfigKeys, KnownKeysIncludeOptionalOnes) {
    const auto keys = knownKeys();
    for (const auto* k : {"database.url", "database.schema", "scanner.max_scan_workers", "logging.log_dir",
                          "logging.log_levels.subsystem_levels.scanner", "discovery.roots"})
        EXPECT_NE(std::find(keys.begin(), keys.end(), k), keys.end()) << k;
}

TEST(ParseBool, AcceptsCommonSpellings) {
    EXPECT_TRUE(parseBool("yes"));
    EXPECT_TRUE(parseBool(" TRUE "));
    EXPECT_TRUE(parseBool("1"));
    EXPECT_FALSE(parseBool("off"));
    EXPECT_FALSE(parseBool("No"));
    EXPECT_THROW(parseBool("maybe"), ConfigError);
}

TEST(ParseLogLevel, AcceptsAliasesAndRejectsUnknown) {
    EXPECT_EQ(parseLogLevel("warning"), spdlog::level::warn);
    EXPECT_EQ(parseLogLevel("ERROR"), spdlog::level::err);
    EXPECT_EQ(parseLogLevel("off"), spdlog::level::off);
    EXPECT_THROW(parseLogLevel("loud"), ConfigError);
}
