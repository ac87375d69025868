#pragma once

#include "cli/types.hpp"

#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace vc::cli {

class Router {
public:
    explicit Router(std::shared_ptr<spdlog::logger> log);

    void registerCommand(const std::string& name, CommandInfo info);

    // Dispatches and maps exceptions to exit codes: invalid_argument is a
    // usage error (2), anything else a failure (1).
    CommandResult execute(const CommandCall& call) const;

    [[nodiscard]] const CommandInfo* find(const std::string& nameOrAlias) const;
    [[nodiscard]] std::string listCommands() const;
    [[nodiscard]] std::unordered_set<std::string> switches() const;

private:
    std::shared_ptr<spdlog::logger> log_;
    std::map<std::string, CommandInfo> commands_;   // ordered for help output
    std::unordered_map<std::string, std::string> aliasMap_;

    std::string canonicalFor(const std::string& nameOrAlias) const;
    static std::string normalize(const std::string& s);
};

}
