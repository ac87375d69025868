#include "cli/commands.hpp"
#include "cli/Router.hpp"
#include "cli/argsHelpers.hpp"

#include <fmt/format.h>

namespace vc::cli {

void registerSystemCommands(Router& r) {
    r.registerCommand("help", {"Show help info", "help [COMMAND]",
        [&r](const CommandCall& c) -> CommandResult {
            if (c.positionals.empty()) return ok(r.listCommands());
            const auto* info = r.find(c.positionals.front());
            if (!info) throw std::invalid_argument("Unknown command: " + c.positionals.front());
            return ok(fmt::format("volcat {}\n\n  {}\n", info->usage, info->description));
        }, {"h", "?"}, {}});
}

}
