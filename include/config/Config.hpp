#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace vc::config {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Backoff doubles per attempt, so the retry count stays well below the shift width.
inline constexpr unsigned int kMaxStoreRetries = 16;

struct DatabaseConfig {
    std::string url;                 // full libpq URI, wins over the fields below when set
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "volcat";
    std::string user = "volcat";
    std::string schema = "public";
    unsigned int pool_size = 2;      // reader connections, the writer is separate
    unsigned int busy_timeout_ms = 5000;
    unsigned int max_retries = 3;          // clamped to kMaxStoreRetries
    unsigned int retry_base_delay_ms = 50;
    std::filesystem::path migrations_dir;

    [[nodiscard]] std::string connectionString() const;
};

struct CatalogConfig {
    unsigned int usage_refresh_events = 100;
    std::chrono::seconds usage_refresh_interval{300};
    std::vector<std::string> ignore_names = {".DS_Store", "Thumbs.db"};
    std::vector<std::string> ignore_suffixes = {".lock", ".tmp", ".swp", ".swx", "~"};
};

struct ScannerConfig {
    unsigned int max_scan_workers = 0; // 0 resolves to hardware_concurrency at load time
    bool auto_scan = true;
    unsigned int progress_every = 250;
    bool follow_symlinks = false;
};

struct WatcherConfig {
    std::chrono::seconds heartbeat_interval{30};
    std::chrono::milliseconds poll_timeout{250};
    bool recursive = true;
};

struct DiscoveryConfig {
    std::vector<std::filesystem::path> roots;
    std::chrono::seconds poll_interval{5};
};

struct JobsConfig {
    std::chrono::seconds stall_after{90};
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum volcat    = spdlog::level::info;  // startup/shutdown, engine lifecycle
    spdlog::level::level_enum identity  = spdlog::level::warn;  // probe degradation is expected, keep quiet
    spdlog::level::level_enum catalog   = spdlog::level::info;
    spdlog::level::level_enum db        = spdlog::level::warn;  // retries and failed transactions
    spdlog::level::level_enum scanner   = spdlog::level::info;
    spdlog::level::level_enum watcher   = spdlog::level::info;
    spdlog::level::level_enum jobs      = spdlog::level::info;
    spdlog::level::level_enum discovery = spdlog::level::info;
    spdlog::level::level_enum cli       = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;
    bool console = true;
    LogLevelsConfig levels;
};

struct Config {
    DatabaseConfig database;
    CatalogConfig catalog;
    ScannerConfig scanner;
    WatcherConfig watcher;
    DiscoveryConfig discovery;
    JobsConfig jobs;
    LoggingConfig logging;

    void save(const std::filesystem::path& path) const;
};

// Missing file yields defaults; malformed YAML or bad values raise ConfigError.
Config loadConfig(const std::filesystem::path& path);

std::filesystem::path configDir();
std::filesystem::path configPath();
std::filesystem::path defaultLogDir();
std::filesystem::path defaultMigrationsDir();

// Dotted-key editing, e.g. "scanner.max_scan_workers"
std::vector<std::string> knownKeys();
std::string getValue(const std::filesystem::path& path, const std::string& key);
std::string setValue(const std::filesystem::path& path, const std::string& key, const std::string& raw);
void unsetValue(const std::filesystem::path& path, const std::string& key);

bool parseBool(const std::string& raw);
spdlog::level::level_enum parseLogLevel(const std::string& raw);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const DatabaseConfig& c);
void to_json(nlohmann::json& j, const CatalogConfig& c);
void to_json(nlohmann::json& j, const ScannerConfig& c);
void to_json(nlohmann::json& j, const WatcherConfig& c);
void to_json(nlohmann::json& j, const DiscoveryConfig& c);
void to_json(nlohmann::json& j, const JobsConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);

} // namespace vc::config
