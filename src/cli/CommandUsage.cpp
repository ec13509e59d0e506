#include "cli/CommandUsage.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace pc::cli {

namespace {

std::string trimRight(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
    return s;
}

std::vector<std::string> wrap(const std::string& s, const int width) {
    const int W = std::max(20, width);
    std::vector<std::string> out;
    std::size_t i = 0;
    const std::size_t n = s.size();
    while (i < n) {
        // skip leading spaces
        while (i < n && std::isspace(static_cast<unsigned char>(s[i])) && s[i] != '\n') ++i;

        // hard break at newline
        if (i < n && s[i] == '\n') {
            out.emplace_back("");
            ++i;
            continue;
        }

        if (i >= n) break;

        const std::size_t end = std::min<std::size_t>(i + W, n);
        std::size_t break_pos = end;

        // prefer last space before end
        if (end < n && s[end] != ' ') {
            const auto sp = s.rfind(' ', end);
            if (sp != std::string::npos && sp >= i) break_pos = sp;
        }

        if (break_pos == i) break_pos = end; // no space found

        out.push_back(trimRight(s.substr(i, break_pos - i)));

        if (break_pos < n && s[break_pos] == ' ') i = break_pos + 1;
        else i = break_pos;
    }
    if (out.empty()) out.emplace_back("");
    return out;
}

void emitWrapped(std::ostringstream& out, const std::string& text, const std::size_t indent, const int width) {
    for (const auto& ln : wrap(text, width - static_cast<int>(indent)))
        out << std::string(indent, ' ') << ln << "\n";
}

std::string keyText(const Entry& it, const bool show_aliases) {
    if (!show_aliases || it.aliases.empty()) return it.label;
    return fmt::format("{} | {}", it.label, fmt::join(it.aliases, " | "));
}

std::size_t computeKeyWidth(const std::vector<Entry>& items, const std::size_t cap, const bool show_aliases) {
    std::size_t w = 0;
    for (const auto& it : items) w = std::max(w, keyText(it, show_aliases).size());
    return std::min(w, cap);
}

std::string padRight(const std::string& s, const std::size_t width) {
    if (s.size() >= width) return s;
    return s + std::string(width - s.size(), ' ');
}

void emitTwoColSection(std::ostringstream& out,
                       const std::string& title,
                       const std::vector<Entry>& items,
                       const int width,
                       const std::size_t max_key_col,
                       const ColorTheme& theme,
                       const bool show_aliases) {
    if (items.empty()) return;
    constexpr std::size_t indent = 2;
    constexpr std::size_t gap = 2;

    out << theme.H() << title << theme.R() << "\n";
    const auto keyw = computeKeyWidth(items, max_key_col, show_aliases);
    const int rightw = width - static_cast<int>(indent + keyw + gap);

    for (const auto& it : items) {
        const auto desc_lines = wrap(it.desc, std::max(20, rightw));

        // Colorize the key, but align using plain-length padding.
        out << std::string(indent, ' ') << theme.K() << padRight(keyText(it, show_aliases), keyw) << theme.R();
        out << std::string(gap, ' ') << desc_lines[0] << "\n";
        for (std::size_t i = 1; i < desc_lines.size(); ++i)
            out << std::string(indent + keyw + gap, ' ') << desc_lines[i] << "\n";
    }
    out << "\n";
}

}

std::string CommandUsage::joinAliasesInline_(const std::string& primary,
                                             const std::vector<std::string>& aliases,
                                             const std::string& sep) {
    if (aliases.empty()) return primary;
    std::ostringstream ss;
    ss << primary;
    for (const auto& a : aliases) ss << sep << a;
    return ss.str();
}

std::string CommandUsage::normalizePositional_(const std::string& s) {
    // If caller already used <> or [] leave it; else wrap as <name>
    if (s.find('<') != std::string::npos || s.find('[') != std::string::npos) return s;
    return fmt::format("<{}>", s);
}

std::string CommandUsage::bracketizeIfNeeded_(const std::string& s, const bool square) {
    if (s.find('<') != std::string::npos || s.find('[') != std::string::npos) return s;
    return square ? fmt::format("[{}]", s) : fmt::format("<{}>", s);
}

std::string CommandUsage::buildSynopsis_() const {
    if (synopsis) return *synopsis;

    std::ostringstream syn;
    syn << "potcheck " << command;

    for (const auto& p : positionals) syn << " " << normalizePositional_(p.label);
    for (const auto& r : required)    syn << " " << bracketizeIfNeeded_(r.label, /*square=*/false);
    for (const auto& o : optional)    syn << " " << bracketizeIfNeeded_(o.label, /*square=*/true);
    return syn.str();
}

std::string CommandUsage::str() const {
    const int tw = term_width > 40 ? term_width : 100;

    std::ostringstream out;

    emitTwoColSection(out, "Arguments:", positionals, tw, max_key_col, theme, show_aliases);
    emitTwoColSection(out, "Required:", required, tw, max_key_col, theme, show_aliases);
    emitTwoColSection(out, "Optional:", optional, tw, max_key_col, theme, show_aliases);
    for (const auto& g : groups)
        emitTwoColSection(out, g.title + ":", g.items, tw, max_key_col, theme, show_aliases);

    if (!examples.empty()) {
        out << theme.H() << "Examples:" << theme.R() << "\n";
        for (const auto& ex : examples) {
            emitWrapped(out, fmt::format("$ {}", ex.cmd), 2, tw);
            if (!ex.note.empty()) emitWrapped(out, ex.note, 4, tw);
            out << "\n";
        }
    }

    return basicStr(true) + out.str();
}

std::string CommandUsage::basicStr(const bool splitHeader) const {
    const int tw = term_width > 40 ? term_width : 100;

    std::ostringstream out;

    const auto head = (!show_aliases || aliases.empty())
        ? command
        : "[" + joinAliasesInline_(command, aliases, " | ") + "]";
    out << theme.C() << head << theme.R();
    if (!description.empty()) out << " - " << description;
    out << "\n";

    if (splitHeader) out << "\n";
    out << theme.H() << "Usage:" << theme.R() << "\n";
    emitWrapped(out, buildSynopsis_(), 2, tw);
    out << "\n";

    return out.str();
}

std::string CommandBook::str() const {
    std::ostringstream out;
    if (!title.empty()) out << title << "\n\n";

    const auto theme = book_theme.value_or(ColorTheme{});
    for (const auto& c : commands) {
        CommandUsage u = c;
        if (book_theme) u.theme = *book_theme;
        out << u.basicStr();
    }

    for (const auto& g : shared)
        emitTwoColSection(out, g.title + ":", g.items, 100, 30, theme, true);

    return out.str();
}

} // namespace pc::cli
