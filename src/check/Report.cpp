#include "check/Report.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iterator>
#include <sstream>

namespace pc::check {

namespace {

std::string plural(const std::size_t n, const std::string& one, const std::string& many) {
    return n == 1 ? "1 " + one : fmt::format("{} {}", n, many);
}

void emitPaths(std::ostringstream& out, const std::vector<Discrepancy>& items) {
    for (const auto& d : items) out << d.path << "\n";
}

// Stale entries are grouped by the list file that declared them
void emitStale(std::ostringstream& out, const std::vector<Discrepancy>& stale, const Palette& p) {
    std::vector<std::string> origins;
    for (const auto& d : stale)
        if (std::ranges::find(origins, d.origin) == origins.end()) origins.push_back(d.origin);

    for (const auto& origin : origins) {
        std::vector<Discrepancy> group;
        std::ranges::copy_if(stale, std::back_inserter(group), [&](const Discrepancy& d) { return d.origin == origin; });
        out << "\n" << p.E() << "error:" << p.R()
            << fmt::format(" Found {} in {} without translatable strings:\n",
                           plural(group.size(), "file", "files"), origin);
        emitPaths(out, group);
    }
}

}

std::string renderText(const CheckResult& result, const Palette& p) {
    std::ostringstream out;
    out << "  " << p.A() << "Checking" << p.R() << " " << result.name << "…\n";

    for (const auto& d : result.ofKind(DiscrepancyKind::UnreadableManifest))
        out << p.E() << "error:" << p.R() << fmt::format(" Could not read '{}': {}\n", d.path, d.detail);

    for (const auto& d : result.ofKind(DiscrepancyKind::MissingFile))
        out << p.E() << "error:" << p.R() << fmt::format(" File '{}' in {} does not exist\n", d.path, d.origin);

    emitStale(out, result.ofKind(DiscrepancyKind::StaleEntry), p);

    if (const auto undeclared = result.ofKind(DiscrepancyKind::UndeclaredFile); !undeclared.empty()) {
        out << "\n" << p.E() << "error:" << p.R()
            << fmt::format(" Found {} with translatable strings not present in {}:\n",
                           plural(undeclared.size(), "file", "files"), result.name);
        emitPaths(out, undeclared);
    }

    if (const auto macros = result.ofKind(DiscrepancyKind::DisallowedMacro); !macros.empty()) {
        out << "\n" << p.E() << "error:" << p.R()
            << fmt::format(" Found {} a gettext macro, use the corresponding method instead:\n",
                           plural(macros.size(), "source file that uses", "source files that use"));
        emitPaths(out, macros);
    }

    for (const auto& d : result.ofKind(DiscrepancyKind::OrderViolation)) {
        out << p.E() << "error:" << p.R()
            << fmt::format(" Found file '{}' before '{}' in {}\n", d.path, d.expected.value_or(""), d.origin);
    }

    if (!result.passed()) out << "\n";
    out << "  Checking " << result.name << " result: "
        << (result.passed() ? p.P() + "ok" : p.N() + "fail") << p.R() << "\n";
    return out.str();
}

std::string renderText(const std::vector<CheckResult>& results, const Palette& palette) {
    std::string out;
    for (const auto& r : results) {
        out += renderText(r, palette);
        out += "\n";
    }
    return out;
}

void to_json(nlohmann::json& j, const Discrepancy& d) {
    j = {
        {"class", to_string(d.kind)},
        {"path", d.path}
    };
    if (!d.origin.empty()) j["origin"] = d.origin;
    if (d.line != 0) j["line"] = d.line;
    if (d.expected) j["expected"] = *d.expected;
    if (d.category) j["category"] = manifest::to_string(*d.category);
    if (!d.detail.empty()) j["detail"] = d.detail;
}

void to_json(nlohmann::json& j, const CheckResult& r) {
    j = {
        {"check", r.name},
        {"passed", r.passed()},
        {"aborted", r.aborted},
        {"discrepancies", r.discrepancies}
    };
}

}
