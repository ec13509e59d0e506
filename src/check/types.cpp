#include "check/types.hpp"

#include <algorithm>
#include <iterator>

namespace pc::check {

std::string to_string(const DiscrepancyKind k) {
    switch (k) {
    case DiscrepancyKind::MissingFile: return "missing_file";
    case DiscrepancyKind::UnreadableManifest: return "unreadable_manifest";
    case DiscrepancyKind::StaleEntry: return "stale_entry";
    case DiscrepancyKind::UndeclaredFile: return "undeclared_file";
    case DiscrepancyKind::DisallowedMacro: return "disallowed_macro";
    case DiscrepancyKind::OrderViolation: return "order_violation";
    }
    return "unknown";
}

std::size_t CheckResult::count(const DiscrepancyKind k) const {
    return static_cast<std::size_t>(std::ranges::count_if(discrepancies, [k](const Discrepancy& d) { return d.kind == k; }));
}

std::vector<Discrepancy> CheckResult::ofKind(const DiscrepancyKind k) const {
    std::vector<Discrepancy> out;
    std::ranges::copy_if(discrepancies, std::back_inserter(out), [k](const Discrepancy& d) { return d.kind == k; });
    return out;
}

}
