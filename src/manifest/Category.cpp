#include "manifest/Category.hpp"
#include "util/files.hpp"

namespace pc::manifest {

std::string to_string(const Category c) {
    switch (c) {
    case Category::Ui: return "ui";
    case Category::Blueprint: return "blueprint";
    case Category::Source: return "source";
    }
    return "unknown";
}

const config::MarkerConfig& markerFor(const Category c, const config::PotfilesConfig& cfg) {
    switch (c) {
    case Category::Ui: return cfg.ui;
    case Category::Blueprint: return cfg.blueprint;
    case Category::Source: break;
    }
    return cfg.source;
}

std::optional<Category> categorize(const std::string_view path, const config::PotfilesConfig& cfg) {
    for (const auto c : ALL_CATEGORIES)
        if (util::endsWith(path, markerFor(c, cfg).extension)) return c;
    return std::nullopt;
}

}
