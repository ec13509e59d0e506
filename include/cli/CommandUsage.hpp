#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pc::cli {

// A simple labeled entry (option/flag), with optional aliases.
struct Entry {
    std::string label;                  // primary, e.g. "--git-staged"
    std::string desc;                   // description
    std::vector<std::string> aliases;   // e.g. {"-s"}
};

// Grouped options section, e.g. "Global Options"
struct GroupedOptions {
    std::string title;
    std::vector<Entry> items;
};

// Example: {"potcheck check -s", "Check only what is about to be committed"}
struct Example {
    std::string cmd;
    std::string note;
};

// ANSI color theme. Set enabled=false to disable.
struct ColorTheme {
    bool enabled = true;

    std::string header = "\033[1;36m"; // section titles (bold cyan)
    std::string command = "\033[1;32m"; // command name (bold green)
    std::string key = "\033[33m";      // left column keys (yellow)
    std::string reset = "\033[0m";     // reset

    [[nodiscard]] std::string maybe(const std::string& code) const {
        return enabled ? code : "";
    }
    [[nodiscard]] std::string H() const { return maybe(header); }
    [[nodiscard]] std::string C() const { return maybe(command); }
    [[nodiscard]] std::string K() const { return maybe(key); }
    [[nodiscard]] std::string R() const { return maybe(reset); }
};

class CommandUsage {
public:
    // identity
    std::string command;                         // e.g. "check"
    std::vector<std::string> aliases;            // e.g. {"all"}
    std::string description;                     // one-liner or paragraph
    std::optional<std::string> synopsis;         // if empty, synthesized

    // arguments/flags
    std::vector<Entry> positionals;              // ordered; appear in synopsis
    std::vector<Entry> required;                 // two-col section
    std::vector<Entry> optional;                 // two-col section
    std::vector<GroupedOptions> groups;          // extra grouped sections

    std::vector<Example> examples;

    // rendering knobs
    int term_width = 100;                        // target width for str()
    std::size_t max_key_col = 30;                // cap left column width
    bool show_aliases = true;
    ColorTheme theme{};

    // full help: header, synopsis, option sections, examples
    [[nodiscard]] std::string str() const;

    // header line and synopsis only
    [[nodiscard]] std::string basicStr(bool splitHeader = false) const;

    [[nodiscard]] const std::string& primary() const { return command; }

private:
    [[nodiscard]] std::string buildSynopsis_() const;
    [[nodiscard]] static std::string normalizePositional_(const std::string& s);
    [[nodiscard]] static std::string bracketizeIfNeeded_(const std::string& s, bool square);
    [[nodiscard]] static std::string joinAliasesInline_(const std::string& primary,
                                                        const std::vector<std::string>& aliases,
                                                        const std::string& sep);
};

// Stitches the commands together for `potcheck help`
class CommandBook {
public:
    std::string title;
    std::vector<CommandUsage> commands;
    std::vector<GroupedOptions> shared;          // options valid for every command

    std::optional<ColorTheme> book_theme;

    [[nodiscard]] std::string str() const;
};

} // namespace pc::cli
