#include "cli/commands.hpp"
#include "cli/Context.hpp"
#include "cli/Router.hpp"
#include "cli/argsHelpers.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace vc::cli {

namespace {

CommandResult handleConfig(const CommandCall& call, Context& ctx) {
    if (call.positionals.empty()) throw std::invalid_argument("config expects a subcommand");

    const auto& sub = call.positionals[0];
    const auto& path = ctx.configPath();
    const auto argc = call.positionals.size();

    if (sub == "list") {
        if (hasFlag(call, "json")) return okJson(ctx.config());
        std::string out = fmt::format("# {}\n", path.string());
        for (const auto& key : config::knownKeys()) out += fmt::format("{} = {}\n", key, config::getValue(path, key));
        return ok(out);
    }

    if (sub == "get") {
        if (argc != 2) throw std::invalid_argument("config get expects KEY");
        return ok(config::getValue(path, call.positionals[1]) + "\n");
    }

    if (sub == "set") {
        if (argc != 3) throw std::invalid_argument("config set expects KEY VALUE");
        const auto stored = config::setValue(path, call.positionals[1], call.positionals[2]);
        return ok(fmt::format("{} = {}\n", call.positionals[1], stored));
    }

    if (sub == "unset") {
        if (argc != 2) throw std::invalid_argument("config unset expects KEY");
        config::unsetValue(path, call.positionals[1]);
        return ok(fmt::format("{} reset to default ({})\n", call.positionals[1],
                              config::getValue(path, call.positionals[1])));
    }

    if (sub == "path") return ok(path.string() + "\n");

    throw std::invalid_argument("Unknown config subcommand: " + sub);
}

}

void registerConfigCommands(Router& r, Context& ctx) {
    r.registerCommand("config", {"Inspect or edit the configuration file",
        "config list [--json] | get KEY | set KEY VALUE | unset KEY | path",
        [&ctx](const CommandCall& c) { return handleConfig(c, ctx); }, {"cfg"}, {"json"}});
}

}
