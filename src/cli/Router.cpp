#include "cli/Router.hpp"
#include "cli/argsHelpers.hpp"
#include "config/Config.hpp"
#include "database/errors.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>

namespace vc::cli {

Router::Router(std::shared_ptr<spdlog::logger> log) : log_(std::move(log)) {}

void Router::registerCommand(const std::string& name, CommandInfo info) {
    const auto key = normalize(name);

    for (const auto& alias : info.aliases) {
        const auto a = normalize(alias);
        if (aliasMap_.contains(a) && aliasMap_.at(a) != key) {
            log_->warn("Alias '{}' already mapped to '{}'; skipping duplicate for '{}'", a, aliasMap_.at(a), key);
            continue;
        }
        aliasMap_[a] = key;
    }

    commands_[key] = std::move(info);
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size() && s[i] == '-') ++i;
    for (; i < s.size(); ++i) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(s[i]))));
    return out;
}

std::string Router::canonicalFor(const std::string& nameOrAlias) const {
    const auto n = normalize(nameOrAlias);
    if (commands_.contains(n)) return n;
    if (const auto it = aliasMap_.find(n); it != aliasMap_.end()) return it->second;
    return n;
}

const CommandInfo* Router::find(const std::string& nameOrAlias) const {
    const auto it = commands_.find(canonicalFor(nameOrAlias));
    return it == commands_.end() ? nullptr : &it->second;
}

std::unordered_set<std::string> Router::switches() const {
    std::unordered_set<std::string> out;
    for (const auto& [_, info] : commands_) out.insert(info.switches.begin(), info.switches.end());
    return out;
}

std::string Router::listCommands() const {
    std::string out = "usage: volcat [--config PATH] [--log-level LEVEL] <command> [args]\n\ncommands:\n";
    size_t width = 0;
    for (const auto& [name, _] : commands_) width = std::max(width, name.size());
    for (const auto& [name, info] : commands_)
        out += fmt::format("  {:<{}}  {}\n", name, width, info.description);
    return out;
}

CommandResult Router::execute(const CommandCall& call) const {
    if (call.name.empty()) return {2, listCommands(), "No command provided."};

    const auto* info = find(call.name);
    if (!info) return {2, "", fmt::format("Unknown command: {}\n\n{}", call.name, listCommands())};

    log_->debug("[Router] Executing command: '{}'", canonicalFor(call.name));

    try {
        return info->handler(call);
    } catch (const std::invalid_argument& e) {
        return invalid(*info, e.what());
    } catch (const config::ConfigError& e) {
        log_->error("[Router] {} failed: {}", call.name, e.what());
        return failure(fmt::format("config error: {}", e.what()));
    } catch (const database::StoreBusy& e) {
        log_->error("[Router] {} failed: {}", call.name, e.what());
        return failure(fmt::format("catalog busy: {}", e.what()));
    } catch (const std::exception& e) {
        log_->error("[Router] {} failed: {}", call.name, e.what());
        return failure(fmt::format("error: {}", e.what()));
    }
}

}
