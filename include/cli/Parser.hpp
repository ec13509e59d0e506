#pragma once

#include "cli/types.hpp"

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace pc::cli {

enum class TokenType { Word, Flag };

struct Token {
    TokenType type;
    std::string text;
};

// Options that take a value; every other flag is a switch
const std::unordered_set<std::string>& valueFlags();

// Heuristic: decide if "-XYZ" is a bundle or "-X<value>".
// If tail contains obvious value chars (/, ., :, =), treat as glued value.
[[nodiscard]] bool looksGluedValue(std::string_view tail);

// Splits --key=value and -Xvalue, expands -abc bundles into -a -b -c, keeps "--" as a Word
std::vector<Token> tokenize(const std::vector<std::string>& args);

// First Word is the command name; flags in valueFlags consume the following Word.
// Everything after "--" is positional.
CommandCall parseTokens(const std::vector<Token>& toks,
                        const std::unordered_set<std::string>& takesValue = valueFlags());

std::string to_string(const Token& t);
std::string to_string(const std::vector<Token>& tokens);

}
