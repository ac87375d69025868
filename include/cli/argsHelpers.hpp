#pragma once

#include "cli/types.hpp"

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace vc::cli {

CommandResult invalid(std::string msg);
CommandResult invalid(const CommandInfo& info, std::string msg);
CommandResult ok(std::string out);
CommandResult okJson(nlohmann::json data, std::string out = {});
CommandResult failure(std::string msg);

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);
std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys);
std::vector<std::string> optVals(const CommandCall& c, const std::string& key);

std::optional<unsigned int> parseUInt(const std::string& sv);

// Flag given without a value, e.g. --json
[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);
[[nodiscard]] bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys);
[[nodiscard]] bool hasKey(const CommandCall& c, const std::string& key);

// --limit N, falling back to `def`; throws std::invalid_argument on garbage
unsigned int limitOpt(const CommandCall& c, unsigned int def);

std::string humanBytes(int64_t bytes);
std::string formatTime(std::time_t t);

}
