#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace vc::config;

inline std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

inline spdlog::level::level_enum levelOr(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    return parseLogLevel(node.as<std::string>());
}

template<>
struct convert<DatabaseConfig> {
    static Node encode(const DatabaseConfig& rhs) {
        Node node;
        if (!rhs.url.empty()) node["url"] = rhs.url;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["name"] = rhs.name;
        node["user"] = rhs.user;
        node["schema"] = rhs.schema;
        node["pool_size"] = rhs.pool_size;
        node["busy_timeout_ms"] = rhs.busy_timeout_ms;
        node["max_retries"] = rhs.max_retries;
        node["retry_base_delay_ms"] = rhs.retry_base_delay_ms;
        if (!rhs.migrations_dir.empty()) node["migrations_dir"] = rhs.migrations_dir.string();
        return node;
    }

    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.url = node["url"].as<std::string>("");
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("volcat");
        rhs.user = node["user"].as<std::string>("volcat");
        rhs.schema = node["schema"].as<std::string>("public");
        rhs.pool_size = node["pool_size"].as<unsigned int>(2);
        rhs.busy_timeout_ms = node["busy_timeout_ms"].as<unsigned int>(5000);
        rhs.max_retries = node["max_retries"].as<unsigned int>(3);
        rhs.retry_base_delay_ms = node["retry_base_delay_ms"].as<unsigned int>(50);
        if (node["migrations_dir"]) rhs.migrations_dir = node["migrations_dir"].as<std::string>();
        return true;
    }
};

template<>
struct convert<CatalogConfig> {
    static Node encode(const CatalogConfig& rhs) {
        Node node;
        node["usage_refresh_events"] = rhs.usage_refresh_events;
        node["usage_refresh_seconds"] = static_cast<long>(rhs.usage_refresh_interval.count());
        node["ignore_names"] = rhs.ignore_names;
        node["ignore_suffixes"] = rhs.ignore_suffixes;
        return node;
    }

    static bool decode(const Node& node, CatalogConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.usage_refresh_events = node["usage_refresh_events"].as<unsigned int>(100);
        rhs.usage_refresh_interval = std::chrono::seconds(node["usage_refresh_seconds"].as<unsigned int>(300));
        if (node["ignore_names"]) rhs.ignore_names = node["ignore_names"].as<std::vector<std::string>>();
        if (node["ignore_suffixes"]) rhs.ignore_suffixes = node["ignore_suffixes"].as<std::vector<std::string>>();
        return true;
    }
};

template<>
struct convert<ScannerConfig> {
    static Node encode(const ScannerConfig& rhs) {
        Node node;
        node["max_scan_workers"] = rhs.max_scan_workers;
        node["auto_scan"] = rhs.auto_scan;
        node["progress_every"] = rhs.progress_every;
        node["follow_symlinks"] = rhs.follow_symlinks;
        return node;
    }

    static bool decode(const Node& node, ScannerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_scan_workers = node["max_scan_workers"].as<unsigned int>(0);
        if (node["auto_scan"]) rhs.auto_scan = parseBool(node["auto_scan"].as<std::string>());
        rhs.progress_every = node["progress_every"].as<unsigned int>(250);
        if (node["follow_symlinks"]) rhs.follow_symlinks = parseBool(node["follow_symlinks"].as<std::string>());
        return true;
    }
};

template<>
struct convert<WatcherConfig> {
    static Node encode(const WatcherConfig& rhs) {
        Node node;
        node["heartbeat_interval_seconds"] = static_cast<long>(rhs.heartbeat_interval.count());
        node["poll_timeout_ms"] = static_cast<long>(rhs.poll_timeout.count());
        node["recursive"] = rhs.recursive;
        return node;
    }

    static bool decode(const Node& node, WatcherConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.heartbeat_interval = std::chrono::seconds(node["heartbeat_interval_seconds"].as<unsigned int>(30));
        rhs.poll_timeout = std::chrono::milliseconds(node["poll_timeout_ms"].as<unsigned int>(250));
        if (node["recursive"]) rhs.recursive = parseBool(node["recursive"].as<std::string>());
        return true;
    }
};

template<>
struct convert<DiscoveryConfig> {
    static Node encode(const DiscoveryConfig& rhs) {
        Node node;
        std::vector<std::string> roots;
        for (const auto& r : rhs.roots) roots.push_back(r.string());
        node["roots"] = roots;
        node["poll_interval_seconds"] = static_cast<long>(rhs.poll_interval.count());
        return node;
    }

    static bool decode(const Node& node, DiscoveryConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.roots.clear();
        if (node["roots"]) for (const auto& r : node["roots"].as<std::vector<std::string>>()) rhs.roots.emplace_back(r);
        rhs.poll_interval = std::chrono::seconds(node["poll_interval_seconds"].as<unsigned int>(5));
        return true;
    }
};

template<>
struct convert<JobsConfig> {
    static Node encode(const JobsConfig& rhs) {
        Node node;
        node["stall_after_seconds"] = static_cast<long>(rhs.stall_after.count());
        return node;
    }

    static bool decode(const Node& node, JobsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.stall_after = std::chrono::seconds(node["stall_after_seconds"].as<unsigned int>(90));
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["volcat"]    = to_std_string(spdlog::level::to_string_view(rhs.volcat));
        node["identity"]  = to_std_string(spdlog::level::to_string_view(rhs.identity));
        node["catalog"]   = to_std_string(spdlog::level::to_string_view(rhs.catalog));
        node["db"]        = to_std_string(spdlog::level::to_string_view(rhs.db));
        node["scanner"]   = to_std_string(spdlog::level::to_string_view(rhs.scanner));
        node["watcher"]   = to_std_string(spdlog::level::to_string_view(rhs.watcher));
        node["jobs"]      = to_std_string(spdlog::level::to_string_view(rhs.jobs));
        node["discovery"] = to_std_string(spdlog::level::to_string_view(rhs.discovery));
        node["cli"]       = to_std_string(spdlog::level::to_string_view(rhs.cli));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.volcat = levelOr(node["volcat"], spdlog::level::info);
        rhs.identity = levelOr(node["identity"], spdlog::level::warn);
        rhs.catalog = levelOr(node["catalog"], spdlog::level::info);
        rhs.db = levelOr(node["db"], spdlog::level::warn);
        rhs.scanner = levelOr(node["scanner"], spdlog::level::info);
        rhs.watcher = levelOr(node["watcher"], spdlog::level::info);
        rhs.jobs = levelOr(node["jobs"], spdlog::level::info);
        rhs.discovery = levelOr(node["discovery"], spdlog::level::info);
        rhs.cli = levelOr(node["cli"], spdlog::level::warn);
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = levelOr(node["console_log_level"], spdlog::level::info);
        rhs.file_log_level = levelOr(node["file_log_level"], spdlog::level::debug);
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        if (!rhs.log_dir.empty()) node["log_dir"] = rhs.log_dir.string();
        node["console"] = rhs.console;
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["log_dir"]) rhs.log_dir = node["log_dir"].as<std::string>();
        if (node["console"]) rhs.console = parseBool(node["console"].as<std::string>());
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
