#include "cli/argsHelpers.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <array>
#include <ctime>
#include <limits>
#include <stdexcept>
#include <fmt/format.h>

namespace vc::cli {

CommandResult invalid(std::string msg) { return {2, "", std::move(msg)}; }
CommandResult ok(std::string out) { return {0, std::move(out), ""}; }
CommandResult failure(std::string msg) { return {1, "", std::move(msg)}; }

CommandResult invalid(const CommandInfo& info, std::string msg) {
    return {2, "", fmt::format("{}\nusage: volcat {}", msg, info.usage)};
}

CommandResult okJson(nlohmann::json data, std::string out) {
    CommandResult r{0, std::move(out), ""};
    r.data = std::move(data);
    r.has_data = true;
    return r;
}

std::optional<std::string> optVal(const CommandCall& c, const std::string& key) {
    std::optional<std::string> out;
    for (const auto& [k, v] : c.options) if (k == key) out = v.value_or(std::string{});
    return out;
}

std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys) {
    for (const auto& k : keys) if (const auto v = optVal(c, k)) return v;
    return std::nullopt;
}

std::vector<std::string> optVals(const CommandCall& c, const std::string& key) {
    std::vector<std::string> out;
    for (const auto& [k, v] : c.options) if (k == key && v) out.push_back(*v);
    return out;
}

bool hasFlag(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return !v.has_value();
    return false;
}

bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys) {
    return std::ranges::any_of(keys, [&c](const auto& k) { return hasFlag(c, k); });
}

bool hasKey(const CommandCall& c, const std::string& key) {
    return std::ranges::any_of(c.options, [&key](const auto& kv) { return kv.key == key; });
}

std::optional<unsigned int> parseUInt(const std::string& sv) {
    if (sv.empty()) return std::nullopt;

    unsigned long long v = 0;
    for (const char c : sv) {
        if (c < '0' || c > '9') return std::nullopt;
        v = v * 10 + static_cast<unsigned>(c - '0');
        if (v > std::numeric_limits<unsigned int>::max()) return std::nullopt;
    }

    return static_cast<unsigned int>(v);
}

unsigned int limitOpt(const CommandCall& c, const unsigned int def) {
    const auto raw = optVal(c, std::vector<std::string>{"limit", "n"});
    if (!raw) return def;
    const auto n = parseUInt(*raw);
    if (!n) throw std::invalid_argument("--limit expects a non-negative integer, got '" + *raw + "'");
    return *n;
}

std::string humanBytes(const int64_t bytes) {
    static constexpr std::array units{"B", "KiB", "MiB", "GiB", "TiB", "PiB"};
    auto v = static_cast<double>(bytes);
    size_t u = 0;
    while (v >= 1024.0 && u + 1 < units.size()) {
        v /= 1024.0;
        ++u;
    }
    if (u == 0) return fmt::format("{} B", bytes);
    return fmt::format("{:.1f} {}", v, units[u]);
}

std::string formatTime(const std::time_t t) {
    if (t == 0) return "-";
    return util::timestampToString(t);
}

}
