#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>

namespace vc::cli {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;          // repeatable; lookups take the last occurrence
    std::vector<std::string> positionals;
};

struct CommandResult {
    int exit_code = 0;                 // 0 ok, 1 failure, 2 usage
    std::string stdout_text;
    std::string stderr_text;
    nlohmann::json data;               // emitted instead of stdout_text under --json
    bool has_data = false;
};

using CommandHandler = std::function<CommandResult(const CommandCall&)>;

struct CommandInfo {
    std::string description;
    std::string usage;
    CommandHandler handler;
    std::unordered_set<std::string> aliases;
    std::unordered_set<std::string> switches;   // flags that never take a value
};

}
