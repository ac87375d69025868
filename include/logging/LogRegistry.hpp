#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace vc::logging {

// Builds the named subsystem loggers. Components receive their logger through
// their constructors; the registry only owns creation and lookup.
class LogRegistry {
public:
    static void init(const config::LoggingConfig& cfg);

    // Console-only loggers at the given level, used before config is readable and by tests.
    static void initConsole(spdlog::level::level_enum level = spdlog::level::warn);

    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    static std::shared_ptr<spdlog::logger> volcat()    { return get("volcat"); }
    static std::shared_ptr<spdlog::logger> identity()  { return get("identity"); }
    static std::shared_ptr<spdlog::logger> catalog()   { return get("catalog"); }
    static std::shared_ptr<spdlog::logger> db()        { return get("db"); }
    static std::shared_ptr<spdlog::logger> scanner()   { return get("scanner"); }
    static std::shared_ptr<spdlog::logger> watcher()   { return get("watcher"); }
    static std::shared_ptr<spdlog::logger> jobs()      { return get("jobs"); }
    static std::shared_ptr<spdlog::logger> discovery() { return get("discovery"); }
    static std::shared_ptr<spdlog::logger> cli()       { return get("cli"); }

    // Overrides every subsystem level, e.g. from --log-level.
    static void setLevel(spdlog::level::level_enum level);

    [[nodiscard]] static bool isInitialized();

private:
    static inline bool initialized_ = false;
};

}
