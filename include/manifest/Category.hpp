#pragma once

#include "config/Config.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace pc::manifest {

enum class Category { Ui, Blueprint, Source };

constexpr std::array ALL_CATEGORIES{Category::Ui, Category::Blueprint, Category::Source};

std::string to_string(Category c);

// First matching extension wins, in Ui, Blueprint, Source order. nullopt = not part of the cross-reference.
std::optional<Category> categorize(std::string_view path, const config::PotfilesConfig& cfg);

const config::MarkerConfig& markerFor(Category c, const config::PotfilesConfig& cfg);

}
