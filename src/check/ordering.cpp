#include "check/ordering.hpp"

#include <algorithm>

namespace pc::check {

std::vector<std::string> sortedByteWise(std::vector<std::string> entries) {
    // std::char_traits<char>::lt compares as unsigned char
    std::ranges::stable_sort(entries, std::less<>{});
    return entries;
}

std::optional<OrderViolation> firstOrderViolation(const std::vector<std::string>& entries) {
    const auto sorted = sortedByteWise(entries);
    for (std::size_t i = 0; i < entries.size(); ++i)
        if (entries[i] != sorted[i]) return OrderViolation{i, entries[i], sorted[i]};
    return std::nullopt;
}

}
