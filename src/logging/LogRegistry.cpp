#include "logging/LogRegistry.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <filesystem>
#include <stdexcept>
#include <vector>

namespace vc::logging {

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

struct Subsystem {
    const char* name;
    spdlog::level::level_enum level;
};

std::vector<Subsystem> subsystems(const config::SubsystemLogLevelsConfig& lv) {
    return {
        {"volcat", lv.volcat},
        {"identity", lv.identity},
        {"catalog", lv.catalog},
        {"db", lv.db},
        {"scanner", lv.scanner},
        {"watcher", lv.watcher},
        {"jobs", lv.jobs},
        {"discovery", lv.discovery},
        {"cli", lv.cli},
    };
}

void registerAll(const std::vector<spdlog::sink_ptr>& sinks, const std::vector<Subsystem>& subs) {
    for (const auto& [name, lvl] : subs) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
}

}

void LogRegistry::init(const config::LoggingConfig& cfg) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    namespace fs = std::filesystem;
    std::vector<spdlog::sink_ptr> sinks;

    if (cfg.console) {
        // stderr so command output on stdout stays machine readable
        const auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        consoleSink->set_level(cfg.levels.console_log_level);
        consoleSink->set_color_mode(spdlog::color_mode::automatic);
        consoleSink->set_pattern(kPattern);
        sinks.push_back(consoleSink);
    }

    if (!cfg.log_dir.empty()) {
        std::error_code ec;
        fs::create_directories(cfg.log_dir, ec);
        if (ec) {
            spdlog::warn("[LogRegistry] Cannot create log dir {}: {}, file logging disabled", cfg.log_dir.string(), ec.message());
        } else {
            const auto logFile = cfg.log_dir / "volcat.log";
            const auto rotatingSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logFile.string(), 1024 * 1024 * 10, 5);
            rotatingSink->set_level(cfg.levels.file_log_level);
            rotatingSink->set_pattern(kPattern);
            sinks.push_back(rotatingSink);
        }
    }

    registerAll(sinks, subsystems(cfg.levels.subsystem_levels));
    initialized_ = true;
    volcat()->debug("[LogRegistry] Initialized log_dir={}", cfg.log_dir.string());
}

void LogRegistry::initConsole(const spdlog::level::level_enum level) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring initConsole()");
        return;
    }

    const auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_level(level);
    consoleSink->set_pattern(kPattern);

    auto subs = subsystems({});
    for (auto& s : subs) s.level = level;
    registerAll({consoleSink}, subs);
    initialized_ = true;
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

void LogRegistry::setLevel(const spdlog::level::level_enum level) {
    for (const auto& s : subsystems({})) {
        const auto logger = get(s.name);
        logger->set_level(level);
        for (const auto& sink : logger->sinks()) sink->set_level(level);
    }
}

bool LogRegistry::isInitialized() { return initialized_; }

}
