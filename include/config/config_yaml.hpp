#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>
#include <stdexcept>

namespace YAML {

using namespace pc::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

// spdlog::level::from_str() maps unknown names to "off"; a typo must not silence a logger
static spdlog::level::level_enum level_from(const Node& node, const std::string& key, const spdlog::level::level_enum def) {
    if (!node[key]) return def;
    const auto name = node[key].as<std::string>();
    const auto lvl = spdlog::level::from_str(name);
    if (lvl == spdlog::level::off && name != "off")
        throw std::runtime_error("Invalid log level '" + name + "' for key '" + key + "'");
    return lvl;
}

template<>
struct convert<MarkerConfig> {
    static bool decode(const Node& node, MarkerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.extension = node["extension"].as<std::string>(rhs.extension);
        rhs.pattern = node["pattern"].as<std::string>(rhs.pattern);
        return true;
    }
};

template<>
struct convert<PotfilesConfig> {
    static bool decode(const Node& node, PotfilesConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.manifest = node["manifest"].as<std::string>(rhs.manifest.string());
        rhs.skip = node["skip"].as<std::string>(rhs.skip.string());
        rhs.scan_root = node["scan_root"].as<std::string>(rhs.scan_root.string());
        if (node["ui"] && !convert<MarkerConfig>::decode(node["ui"], rhs.ui)) return false;
        if (node["blueprint"] && !convert<MarkerConfig>::decode(node["blueprint"], rhs.blueprint)) return false;
        if (node["source"] && !convert<MarkerConfig>::decode(node["source"], rhs.source)) return false;
        rhs.disallowed_macro = node["disallowed_macro"].as<std::string>(rhs.disallowed_macro);
        return true;
    }
};

template<>
struct convert<ResourcesConfig> {
    static bool decode(const Node& node, ResourcesConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(rhs.enabled);
        rhs.gresource = node["gresource"].as<std::string>(rhs.gresource.string());
        rhs.blueprint_list = node["blueprint_list"].as<std::string>(rhs.blueprint_list.string());
        rhs.blueprint_base = node["blueprint_base"].as<std::string>(rhs.blueprint_base.string());
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.potcheck = level_from(node, "potcheck", rhs.potcheck);
        rhs.manifest = level_from(node, "manifest", rhs.manifest);
        rhs.scan = level_from(node, "scan", rhs.scan);
        rhs.check = level_from(node, "check", rhs.check);
        rhs.git = level_from(node, "git", rhs.git);
        rhs.blueprint = level_from(node, "blueprint", rhs.blueprint);
        rhs.cli = level_from(node, "cli", rhs.cli);
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = level_from(node, "console_log_level", rhs.console_log_level);
        rhs.file_log_level = level_from(node, "file_log_level", rhs.file_log_level);
        if (node["subsystem_levels"] &&
            !convert<SubsystemLogLevelsConfig>::decode(node["subsystem_levels"], rhs.subsystem_levels)) return false;
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.file = node["file"].as<std::string>(rhs.file);
        if (node["levels"] && !convert<LogLevelsConfig>::decode(node["levels"], rhs.levels)) return false;
        return true;
    }
};

template<>
struct convert<OutputConfig> {
    static bool decode(const Node& node, OutputConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.color = node["color"].as<bool>(rhs.color);
        return true;
    }
};

} // namespace YAML
