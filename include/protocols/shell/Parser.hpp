#pragma once

#include "protocols/shell/Token.hpp"
#include "protocols/shell/types.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace fw::protocols::shell {

// Flags that never take a value, so "--recursive ~/Docs" keeps the path positional.
inline const std::unordered_set<std::string>& booleanFlags() {
    static const std::unordered_set<std::string> flags{
        "json", "commit", "recursive", "r", "copy", "help", "h"
    };
    return flags;
}

// The first Word that is not a flag value is the command name; flags may appear anywhere.
inline CommandCall parseTokens(const std::vector<Token>& toks,
                               const std::unordered_set<std::string>& boolFlags = booleanFlags()) {
    CommandCall call;
    call.options.reserve(8);
    call.positionals.reserve(8);

    bool stop_flags = false;

    for (size_t i = 0; i < toks.size(); ++i) {
        const Token& t = toks[i];

        if (!stop_flags && t.type == TokenType::Word && t.text == "--") {
            stop_flags = true;
            continue;
        }

        if (!stop_flags && t.type == TokenType::Flag) {
            const bool takesValue = !boolFlags.contains(t.text);
            if (takesValue && i + 1 < toks.size() && toks[i + 1].type == TokenType::Word && toks[i + 1].text != "--") {
                call.options.push_back({t.text, toks[i + 1].text});
                ++i;
            } else {
                call.options.push_back({t.text, std::nullopt});
            }
            continue;
        }

        if (call.name.empty()) call.name = t.text;
        else call.positionals.push_back(t.text);
    }

    return call;
}

}
