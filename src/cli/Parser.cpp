#include "cli/Parser.hpp"

#include <algorithm>

namespace pc::cli {

namespace {

// Upsert a flag (last wins)
void setOpt(CommandCall& c, const std::string& key, const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

void pushFlag(std::vector<Token>& out, std::string k) {
    out.push_back({TokenType::Flag, std::move(k)});
}

void pushWord(std::vector<Token>& out, std::string v) {
    out.push_back({TokenType::Word, std::move(v)});
}

bool looksNegativeNumber(const std::string_view s) {
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

}

const std::unordered_set<std::string>& valueFlags() {
    static const std::unordered_set<std::string> flags{
        "C", "root", "c", "config", "compiler", "output", "base"
    };
    return flags;
}

bool looksGluedValue(const std::string_view tail) {
    return std::ranges::any_of(tail, [](const char c) { return c == '/' || c == '.' || c == ':' || c == '='; });
}

std::vector<Token> tokenize(const std::vector<std::string>& args) {
    std::vector<Token> out;
    out.reserve(args.size() + 4);

    bool stop_flags = false;
    for (const auto& a : args) {
        if (stop_flags) { pushWord(out, a); continue; }

        if (a == "--") {
            pushWord(out, a);
            stop_flags = true;
            continue;
        }

        if (a.size() < 2 || a[0] != '-' || looksNegativeNumber(a)) {
            pushWord(out, a); // plain arg
            continue;
        }

        // Long flag forms: --key or --key=value
        if (a.rfind("--", 0) == 0) {
            const auto eq = a.find('=');
            if (eq == std::string::npos) {
                pushFlag(out, a.substr(2));
            } else {
                pushFlag(out, a.substr(2, eq - 2));
                pushWord(out, a.substr(eq + 1));
            }
            continue;
        }

        if (a.size() == 2) {
            pushFlag(out, a.substr(1));
            continue;
        }

        // Could be bundle "-abc" or glued "-kVALUE"
        const std::string_view tail = std::string_view(a).substr(2);
        if (valueFlags().contains(std::string(1, a[1])) || looksGluedValue(tail)) {
            pushFlag(out, std::string(1, a[1]));
            std::string value(tail);
            if (!value.empty() && value[0] == '=') value.erase(value.begin());
            pushWord(out, std::move(value));
        } else {
            for (const char c : std::string_view(a).substr(1)) pushFlag(out, std::string(1, c));
        }
    }

    return out;
}

CommandCall parseTokens(const std::vector<Token>& toks, const std::unordered_set<std::string>& takesValue) {
    CommandCall call;
    call.options.reserve(8);
    call.positionals.reserve(8);

    bool stop_flags = false;

    for (size_t i = 0; i < toks.size(); ++i) {
        const Token& t = toks[i];

        // Sentinel: "--" arrives as a Word from the tokenizer
        if (!stop_flags && t.type == TokenType::Word && t.text == "--") {
            stop_flags = true;
            continue;
        }

        if (!stop_flags && t.type == TokenType::Flag) {
            if (takesValue.contains(t.text) && i + 1 < toks.size() && toks[i + 1].type == TokenType::Word) {
                setOpt(call, t.text, toks[i + 1].text);
                ++i; // consumed value
            } else {
                setOpt(call, t.text, std::nullopt);
            }
            continue;
        }

        // Command name = first Word before "--"
        if (!stop_flags && call.name.empty() && call.positionals.empty()) {
            call.name = t.text;
            continue;
        }

        call.positionals.push_back(t.text);
    }

    return call;
}

std::string to_string(const Token& t) {
    switch (t.type) {
    case TokenType::Word: return "Word(" + t.text + ")";
    case TokenType::Flag: return "Flag(" + t.text + ")";
    }
    return "UnknownToken";
}

std::string to_string(const std::vector<Token>& tokens) {
    std::string out;
    out.reserve(64 + tokens.size() * 16);
    for (const auto& t : tokens) {
        if (!out.empty()) out += " ";
        out += to_string(t);
    }
    return out;
}

}
