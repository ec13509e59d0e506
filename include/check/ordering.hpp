#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pc::check {

struct OrderViolation {
    std::size_t index;       // position of the first mismatch
    std::string found;       // entry at that position
    std::string expected;    // entry that belongs there
};

// Byte-wise ("C" locale) stable order; ties keep their relative position
std::vector<std::string> sortedByteWise(std::vector<std::string> entries);

// Compares entries with their sorted order position by position and stops at the first mismatch
std::optional<OrderViolation> firstOrderViolation(const std::vector<std::string>& entries);

}
