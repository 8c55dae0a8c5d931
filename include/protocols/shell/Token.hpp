#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace fw::protocols::shell {

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

// "-Xtail" with a path-ish tail is "-X tail", otherwise a bundle of short flags.
inline bool looks_glued_value(std::string_view tail) {
    return std::ranges::any_of(tail, [](const char c) { return c == '/' || c == '.' || c == ':' || c == '=' || c == '~'; });
}

// Classifies one already-split argument. The shell did the quoting, so no quote handling here.
inline void classifyArg(const std::string& a, std::vector<Token>& out) {
    if (a == "--" || a == "-" || a.empty() || a[0] != '-' || looks_negative_number(a)) {
        pushWord(out, a);
        return;
    }

    if (a.starts_with("--")) {
        const auto eq = a.find('=');
        if (eq == std::string::npos) pushFlag(out, a.substr(2));
        else {
            pushFlag(out, a.substr(2, eq - 2));
            pushWord(out, a.substr(eq + 1));
        }
        return;
    }

    if (a.size() == 2) {
        pushFlag(out, a.substr(1));
        return;
    }

    std::string tail = a.substr(2);
    if (looks_glued_value(tail)) {
        pushFlag(out, std::string(1, a[1]));
        if (tail[0] == '=') tail.erase(tail.begin());
        pushWord(out, std::move(tail));
    } else {
        for (const char c : std::string_view(a).substr(1)) pushFlag(out, std::string(1, c));
    }
}

inline std::vector<Token> tokenizeArgs(const std::vector<std::string>& args) {
    std::vector<Token> out;
    out.reserve(args.size() + 4);
    bool afterSentinel = false;
    for (const auto& a : args) {
        if (afterSentinel) pushWord(out, a);
        else classifyArg(a, out);
        if (a == "--") afterSentinel = true;
    }
    return out;
}

inline std::string read_quoted(const char*& p, const char* e, const char quote) {
    ++p;
    std::string buf;
    while (p < e) {
        if (*p == quote) { ++p; break; }
        if (quote == '"' && *p == '\\' && p + 1 < e) {
            ++p;
            buf.push_back(*p++);
            continue;
        }
        buf.push_back(*p++);
    }
    return buf;
}

// Splits a command line the way a POSIX shell would for simple quoting, then classifies
// each atom like argv. Used for scripted input ("fwctl" prefix optional).
inline std::vector<Token> tokenize(const std::string& line) {
    std::vector<std::string> atoms;
    const char* p = line.c_str();
    const char* e = p + line.size();

    while (p < e) {
        while (p < e && (*p == ' ' || *p == '\t')) ++p;
        if (p >= e) break;

        std::string atom;
        while (p < e && *p != ' ' && *p != '\t') {
            if (*p == '"' || *p == '\'') atom += read_quoted(p, e, *p);
            else atom.push_back(*p++);
        }
        atoms.push_back(std::move(atom));
    }

    if (!atoms.empty() && atoms.front() == "fwctl") atoms.erase(atoms.begin());
    return tokenizeArgs(atoms);
}

}
