#pragma once

#include "manifest/Category.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pc::check {

enum class ExitCode : int {
    Ok = 0,
    CheckFailed = 1,
    MissingDependency = 2
};

enum class DiscrepancyKind {
    MissingFile,         // declared entry does not exist on disk
    UnreadableManifest,  // the list or XML file itself could not be read or parsed
    StaleEntry,          // declared, but no marker found in the file (class A)
    UndeclaredFile,      // marker found, but not declared (class B)
    DisallowedMacro,     // macro-style gettext call (class C)
    OrderViolation       // first out-of-order entry (class D)
};

std::string to_string(DiscrepancyKind k);

struct Discrepancy {
    DiscrepancyKind kind;
    std::string path;
    std::string origin;                         // list file the entry was read from, empty for scan results
    std::size_t line = 0;                       // 1-based line in origin, 0 if not applicable
    std::optional<std::string> expected;        // OrderViolation: entry that belongs at this position
    std::optional<manifest::Category> category;
    std::string detail;
};

struct CheckResult {
    std::string name;                           // manifest being checked, as shown to the user
    std::vector<Discrepancy> discrepancies;
    bool aborted = false;                       // later steps skipped after a fatal discrepancy

    [[nodiscard]] bool passed() const { return discrepancies.empty(); }
    [[nodiscard]] std::size_t count(DiscrepancyKind k) const;
    [[nodiscard]] std::vector<Discrepancy> ofKind(DiscrepancyKind k) const;
};

}
