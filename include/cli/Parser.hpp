#pragma once

#include "cli/Token.hpp"
#include "cli/types.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace vc::cli {

inline void addOpt(CommandCall& c, const std::string& key, const std::optional<std::string>& val) {
    c.options.push_back(FlagKV{key, val});
}

// First Word is the command; a Flag followed by a Word takes it as its value
// unless the flag is a known switch. Everything after "--" is positional.
inline CommandCall parseTokens(const std::vector<Token>& toks, const std::unordered_set<std::string>& switches = {}) {
    CommandCall call;
    call.options.reserve(8);
    call.positionals.reserve(8);

    size_t i = 0;
    bool stop_flags = false;

    for (; i < toks.size(); ++i) {
        const Token& t = toks[i];

        if (!stop_flags && t.type == TokenType::Word && t.text == "--") {
            stop_flags = true;
            continue;
        }

        if (!stop_flags && t.type == TokenType::Flag) {
            const bool isSwitch = switches.contains(t.text);
            if (!isSwitch && i + 1 < toks.size() && toks[i + 1].type == TokenType::Word && toks[i + 1].text != "--") {
                addOpt(call, t.text, toks[i + 1].text);
                ++i;
            } else {
                addOpt(call, t.text, std::nullopt);
            }
            continue;
        }

        if (call.name.empty() && !stop_flags) call.name = t.text;
        else call.positionals.push_back(t.text);
    }

    return call;
}

}
