#include "cli/Context.hpp"
#include "cli/Parser.hpp"
#include "cli/Router.hpp"
#include "cli/argsHelpers.hpp"
#include "cli/commands.hpp"
#include "config/Config.hpp"
#include "logging/LogRegistry.hpp"

#include <cstdio>
#include <optional>
#include <string>
#include <vector>
#include <fmt/core.h>

using namespace vc;
using namespace vc::cli;
using namespace vc::logging;

namespace {

// Global options are read straight off the token stream, before any command
// is known, because the config decides how logging and the store come up.
std::optional<std::string> globalOpt(const std::vector<Token>& toks, const std::vector<std::string>& names) {
    std::optional<std::string> out;
    for (size_t i = 0; i + 1 < toks.size(); ++i) {
        if (toks[i].type != TokenType::Flag) continue;
        for (const auto& n : names)
            if (toks[i].text == n && toks[i + 1].type == TokenType::Word) out = toks[i + 1].text;
    }
    return out;
}

void emit(const CommandResult& res) {
    if (res.has_data) fmt::print("{}\n", res.data.dump(2));
    else if (!res.stdout_text.empty()) fmt::print("{}", res.stdout_text);

    if (!res.stderr_text.empty()) {
        fmt::print(stderr, "{}", res.stderr_text);
        if (res.stderr_text.back() != '\n') fmt::print(stderr, "\n");
    }
}

}

int main(const int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    const auto tokens = tokenize(args);

    std::optional<spdlog::level::level_enum> levelOverride;
    config::Config cfg;
    const auto cfgPath = globalOpt(tokens, {"config", "c"}).value_or(config::configPath().string());

    try {
        if (const auto raw = globalOpt(tokens, {"log-level"})) levelOverride = config::parseLogLevel(*raw);
    } catch (const config::ConfigError& e) {
        fmt::print(stderr, "{}\n", e.what());
        return 2;
    }

    try {
        cfg = config::loadConfig(cfgPath);
    } catch (const config::ConfigError& e) {
        fmt::print(stderr, "config error: {}\n", e.what());
        return 1;
    }

    try {
        LogRegistry::init(cfg.logging);
        if (levelOverride) LogRegistry::setLevel(*levelOverride);

        Context ctx(cfgPath, cfg);
        Router router(LogRegistry::cli());
        registerAllCommands(router, ctx);

        auto switches = router.switches();
        switches.insert({"help", "h"});

        auto call = parseTokens(tokens, switches);
        if (hasKey(call, "help") || hasKey(call, "h")) {
            call.positionals.clear();
            if (!call.name.empty()) call.positionals.push_back(call.name);
            call.name = "help";
        }

        const auto res = router.execute(call);
        emit(res);
        return res.exit_code;
    } catch (const std::exception& e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return 1;
    }
}
