#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace vc::cli {

enum class TokenType { Word, Flag };

struct Token {
    TokenType type;
    std::string text;
};

inline bool looks_negative_number(std::string_view s) {
    if (s.size() < 2 || s[0] != '-') return false;
    bool dot = false, digit = false;
    for (size_t i = 1; i < s.size(); ++i) {
        const char c = s[i];
        if (c >= '0' && c <= '9') { digit = true; continue; }
        if (c == '.' && !dot) { dot = true; continue; }
        return false;
    }
    return digit;
}

inline void pushFlag(std::vector<Token>& out, std::string k) {
    while (!k.empty() && k[0] == '-') k.erase(k.begin());
    out.push_back({TokenType::Flag, std::move(k)});
}

inline void pushWord(std::vector<Token>& out, std::string v) {
    out.push_back({TokenType::Word, std::move(v)});
}

// "-w4" or "-c/etc/volcat.yaml": a short flag with its value glued on
inline bool looks_glued_value(std::string_view tail) {
    return std::ranges::any_of(tail, [](const char c) {
        return c == '/' || c == '.' || c == ':' || c == '=' || (c >= '0' && c <= '9');
    });
}

inline void expand_bundle(std::string_view bundle, std::vector<Token>& out) {
    for (const char c : bundle) pushFlag(out, std::string(1, c));
}

// argv is already split by the shell, so each element is one atom.
inline std::vector<Token> tokenize(const std::vector<std::string>& args) {
    std::vector<Token> out;
    out.reserve(args.size() + 4);
    bool literal = false;

    for (const auto& a : args) {
        if (literal || a.empty() || a == "-" || a[0] != '-' || looks_negative_number(a)) {
            pushWord(out, a);
            continue;
        }

        if (a == "--") {
            pushWord(out, "--");
            literal = true;
            continue;
        }

        if (a.rfind("--", 0) == 0) {
            const auto eq = a.find('=');
            if (eq == std::string::npos) pushFlag(out, a.substr(2));
            else {
                pushFlag(out, a.substr(2, eq - 2));
                pushWord(out, a.substr(eq + 1));
            }
            continue;
        }

        if (a.size() == 2) {
            pushFlag(out, a.substr(1));
            continue;
        }

        const std::string_view tail = std::string_view(a).substr(2);
        if (looks_glued_value(tail)) {
            pushFlag(out, std::string(1, a[1]));
            std::string value(tail);
            if (!value.empty() && value[0] == '=') value.erase(value.begin());
            pushWord(out, std::move(value));
        } else {
            expand_bundle(std::string_view(a).substr(1), out);
        }
    }

    return out;
}

inline std::string to_string(const Token& t) {
    switch (t.type) {
    case TokenType::Word: return "Word(" + t.text + ")";
    case TokenType::Flag: return "Flag(" + t.text + ")";
    }
    return "UnknownToken";
}

}
