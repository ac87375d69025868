#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <sstream>
#include <thread>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace vc::config {

namespace fs = std::filesystem;

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](const unsigned char c) { return std::tolower(c); });
    return s;
}

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::vector<std::string> splitKey(const std::string& key) {
    std::vector<std::string> parts;
    std::stringstream ss(key);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (part.empty()) throw ConfigError("Malformed config key: " + key);
        parts.push_back(part);
    }
    if (parts.empty()) throw ConfigError("Empty config key");
    return parts;
}

YAML::Node loadRaw(const fs::path& path) {
    if (!fs::exists(path)) return YAML::Node(YAML::NodeType::Map);
    try {
        auto root = YAML::LoadFile(path.string());
        if (root.IsNull()) return YAML::Node(YAML::NodeType::Map);
        if (!root.IsMap()) throw ConfigError("Config root must be a mapping: " + path.string());
        return root;
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }
}

template <typename T>
void decodeSection(const YAML::Node& root, const char* name, T& out) {
    const auto node = root[name];
    if (!node) return;
    if (!YAML::convert<T>::decode(node, out))
        throw ConfigError(fmt::format("Config section '{}' must be a mapping", name));
}

Config fromNode(const YAML::Node& root) {
    Config cfg;
    try {
        decodeSection(root, "database", cfg.database);
        decodeSection(root, "catalog", cfg.catalog);
        decodeSection(root, "scanner", cfg.scanner);
        decodeSection(root, "watcher", cfg.watcher);
        decodeSection(root, "discovery", cfg.discovery);
        decodeSection(root, "jobs", cfg.jobs);
        decodeSection(root, "logging", cfg.logging);
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("Invalid config value: {}", e.what()));
    }

    if (cfg.discovery.poll_interval < std::chrono::seconds(1)) cfg.discovery.poll_interval = std::chrono::seconds(1);
    if (cfg.database.pool_size == 0) cfg.database.pool_size = 1;
    cfg.database.max_retries = std::min(cfg.database.max_retries, kMaxStoreRetries);
    if (cfg.scanner.progress_every == 0) cfg.scanner.progress_every = 1;
    return cfg;
}

// Resolved after decode so the saved file keeps "0 = auto" and relative defaults untouched.
void applyRuntimeDefaults(Config& cfg) {
    if (cfg.scanner.max_scan_workers == 0)
        cfg.scanner.max_scan_workers = std::max(1u, std::thread::hardware_concurrency());
    if (cfg.logging.log_dir.empty()) cfg.logging.log_dir = defaultLogDir();
    if (cfg.database.migrations_dir.empty()) cfg.database.migrations_dir = defaultMigrationsDir();
    if (const char* url = std::getenv("VOLCAT_DATABASE_URL"); url && *url) cfg.database.url = url;
}

YAML::Node toNode(const Config& cfg) {
    YAML::Node root(YAML::NodeType::Map);
    root["database"] = cfg.database;
    root["catalog"] = cfg.catalog;
    root["scanner"] = cfg.scanner;
    root["watcher"] = cfg.watcher;
    root["discovery"] = cfg.discovery;
    root["jobs"] = cfg.jobs;
    root["logging"] = cfg.logging;
    return root;
}

void writeNode(const fs::path& path, const YAML::Node& root) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    YAML::Emitter out;
    out << root;
    const auto tmp = fs::path(path.string() + ".tmp");
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f.is_open()) throw ConfigError("Failed to write config file: " + tmp.string());
        f << "# volcat configuration\n" << out.c_str() << '\n';
    }
    fs::rename(tmp, path);
}

bool isListKey(const std::string& key) {
    return key == "discovery.roots" || key == "catalog.ignore_names" || key == "catalog.ignore_suffixes";
}

std::string emitScalarOrSeq(const YAML::Node& node) {
    if (node.IsSequence()) {
        std::vector<std::string> items;
        for (const auto& n : node) items.push_back(n.as<std::string>());
        return fmt::format("{}", fmt::join(items, ","));
    }
    if (node.IsScalar()) return node.as<std::string>();
    YAML::Emitter out;
    out << node;
    return out.c_str();
}

}

std::string DatabaseConfig::connectionString() const {
    if (!url.empty()) return url;
    std::string conn = fmt::format("host={} port={} dbname={} user={} connect_timeout=5", host, port, name, user);
    if (const char* pass = std::getenv("VOLCAT_DB_PASSWORD"); pass && *pass) conn += fmt::format(" password={}", pass);
    return conn;
}

fs::path configDir() {
    if (const char* dir = std::getenv("VOLCAT_CONFIG_DIR"); dir && *dir) return dir;
    if (const char* home = std::getenv("HOME"); home && *home) return fs::path(home) / ".volcat";
    return fs::current_path() / ".volcat";
}

fs::path configPath() { return configDir() / "config.yaml"; }

fs::path defaultLogDir() { return configDir() / "logs"; }

fs::path defaultMigrationsDir() {
#ifdef VOLCAT_MIGRATIONS_DIR
    return VOLCAT_MIGRATIONS_DIR;
#else
    return "/usr/share/volcat/migrations";
#endif
}

bool parseBool(const std::string& raw) {
    const auto v = lower(trim(raw));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw ConfigError("Not a boolean: '" + raw + "'");
}

spdlog::level::level_enum parseLogLevel(const std::string& raw) {
    auto v = lower(trim(raw));
    if (v == "warning") v = "warn";
    if (v == "error") v = "err";
    if (v == "crit") v = "critical";
    const auto lvl = spdlog::level::from_str(v);
    // from_str maps unknown names to off, so only accept off when asked for
    if (lvl == spdlog::level::off && v != "off") throw ConfigError("Unknown log level: '" + raw + "'");
    return lvl;
}

Config loadConfig(const fs::path& path) {
    auto cfg = fromNode(loadRaw(path));
    applyRuntimeDefaults(cfg);
    return cfg;
}

void Config::save(const fs::path& path) const { writeNode(path, toNode(*this)); }

std::vector<std::string> knownKeys() {
    std::vector<std::string> keys;
    const auto root = toNode(Config{});
    std::function<void(const YAML::Node&, const std::string&)> walk = [&](const YAML::Node& n, const std::string& prefix) {
        for (const auto& kv : n) {
            const auto key = prefix.empty() ? kv.first.as<std::string>() : prefix + "." + kv.first.as<std::string>();
            if (kv.second.IsMap()) walk(kv.second, key);
            else keys.push_back(key);
        }
    };
    walk(root, "");
    // optional keys the encoder omits when empty
    keys.emplace_back("database.url");
    keys.emplace_back("database.migrations_dir");
    keys.emplace_back("logging.log_dir");
    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
    return keys;
}

static void requireKnown(const std::string& key) {
    const auto keys = knownKeys();
    if (std::find(keys.begin(), keys.end(), key) == keys.end())
        throw ConfigError("Unknown config key: " + key);
}

std::string getValue(const fs::path& path, const std::string& key) {
    requireKnown(key);
    auto cfg = fromNode(loadRaw(path));
    if (key == "database.url" && cfg.database.url.empty()) return "";
    if (key == "database.migrations_dir" && cfg.database.migrations_dir.empty()) return defaultMigrationsDir().string();
    if (key == "logging.log_dir" && cfg.logging.log_dir.empty()) return defaultLogDir().string();

    YAML::Node node = toNode(cfg);
    for (const auto& part : splitKey(key)) {
        node.reset(node[part]);
        if (!node) throw ConfigError("Unknown config key: " + key);
    }
    return emitScalarOrSeq(node);
}

std::string setValue(const fs::path& path, const std::string& key, const std::string& raw) {
    requireKnown(key);
    auto root = loadRaw(path);
    const auto parts = splitKey(key);

    std::vector<YAML::Node> chain{root};
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        YAML::Node child = chain.back()[parts[i]];
        if (!child || !child.IsMap()) chain.back()[parts[i]] = YAML::Node(YAML::NodeType::Map);
        chain.push_back(chain.back()[parts[i]]);
    }

    if (isListKey(key)) {
        YAML::Node seq(YAML::NodeType::Sequence);
        std::stringstream ss(raw);
        std::string item;
        while (std::getline(ss, item, ',')) if (const auto t = trim(item); !t.empty()) seq.push_back(t);
        chain.back()[parts.back()] = seq;
    } else {
        chain.back()[parts.back()] = trim(raw);
    }

    fromNode(root); // throws ConfigError if the new value does not decode
    writeNode(path, root);
    return getValue(path, key);
}

void unsetValue(const fs::path& path, const std::string& key) {
    requireKnown(key);
    auto root = loadRaw(path);
    const auto parts = splitKey(key);

    YAML::Node node = root;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        YAML::Node child = node[parts[i]];
        if (!child || !child.IsMap()) return;
        node.reset(child);
    }
    if (!node[parts.back()]) return;
    node.remove(parts.back());
    writeNode(path, root);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"database", c.database},
        {"catalog", c.catalog},
        {"scanner", c.scanner},
        {"watcher", c.watcher},
        {"discovery", c.discovery},
        {"jobs", c.jobs},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const DatabaseConfig& c) {
    j = {
        {"host", c.host},
        {"port", c.port},
        {"name", c.name},
        {"user", c.user},
        {"schema", c.schema},
        {"pool_size", c.pool_size},
        {"busy_timeout_ms", c.busy_timeout_ms},
        {"max_retries", c.max_retries},
        {"retry_base_delay_ms", c.retry_base_delay_ms},
        {"migrations_dir", c.migrations_dir.string()}
        // url may embed credentials, never serialize it
    };
}

void to_json(nlohmann::json& j, const CatalogConfig& c) {
    j = {
        {"usage_refresh_events", c.usage_refresh_events},
        {"usage_refresh_seconds", c.usage_refresh_interval.count()},
        {"ignore_names", c.ignore_names},
        {"ignore_suffixes", c.ignore_suffixes}
    };
}

void to_json(nlohmann::json& j, const ScannerConfig& c) {
    j = {
        {"max_scan_workers", c.max_scan_workers},
        {"auto_scan", c.auto_scan},
        {"progress_every", c.progress_every},
        {"follow_symlinks", c.follow_symlinks}
    };
}

void to_json(nlohmann::json& j, const WatcherConfig& c) {
    j = {
        {"heartbeat_interval_seconds", c.heartbeat_interval.count()},
        {"poll_timeout_ms", c.poll_timeout.count()},
        {"recursive", c.recursive}
    };
}

void to_json(nlohmann::json& j, const DiscoveryConfig& c) {
    std::vector<std::string> roots;
    for (const auto& r : c.roots) roots.push_back(r.string());
    j = {
        {"roots", roots},
        {"poll_interval_seconds", c.poll_interval.count()}
    };
}

void to_json(nlohmann::json& j, const JobsConfig& c) {
    j = {{"stall_after_seconds", c.stall_after.count()}};
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"console", c.console},
        {"levels", c.levels}
    };
}

static std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"volcat", levelName(c.volcat)},
        {"identity", levelName(c.identity)},
        {"catalog", levelName(c.catalog)},
        {"db", levelName(c.db)},
        {"scanner", levelName(c.scanner)},
        {"watcher", levelName(c.watcher)},
        {"jobs", levelName(c.jobs)},
        {"discovery", levelName(c.discovery)},
        {"cli", levelName(c.cli)}
    };
}

}
