#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace pc::config {

namespace {

template <typename T>
void decodeSection(const YAML::Node& root, const std::string& key, T& section) {
    const auto node = root[key];
    if (!node) return;
    if (!YAML::convert<T>::decode(node, section))
        throw std::runtime_error("Config section '" + key + "' must be a mapping");
}

Config fromRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Config root must be a mapping");

    decodeSection(root, "potfiles", cfg.potfiles);
    decodeSection(root, "resources", cfg.resources);
    decodeSection(root, "logging", cfg.logging);
    decodeSection(root, "output", cfg.output);

    return cfg;
}

std::string levelName(const spdlog::level::level_enum lvl) {
    return YAML::to_std_string(spdlog::level::to_string_view(lvl));
}

}

Config loadConfig(const std::filesystem::path& path) {
    try {
        return fromRoot(YAML::LoadFile(path.string()));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config " + path.string() + ": " + e.what());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error("Invalid config " + path.string() + ": " + e.what());
    }
}

Config loadConfigFromString(const std::string& yaml) {
    try {
        return fromRoot(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Failed to parse config: ") + e.what());
    }
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"potfiles", c.potfiles},
        {"resources", c.resources},
        {"logging", c.logging},
        {"output", c.output}
    };
}

void to_json(nlohmann::json& j, const MarkerConfig& c) {
    j = {
        {"extension", c.extension},
        {"pattern", c.pattern}
    };
}

void to_json(nlohmann::json& j, const PotfilesConfig& c) {
    j = {
        {"manifest", c.manifest.generic_string()},
        {"skip", c.skip.generic_string()},
        {"scan_root", c.scan_root.generic_string()},
        {"ui", c.ui},
        {"blueprint", c.blueprint},
        {"source", c.source},
        {"disallowed_macro", c.disallowed_macro}
    };
}

void to_json(nlohmann::json& j, const ResourcesConfig& c) {
    j = {
        {"enabled", c.enabled},
        {"gresource", c.gresource.generic_string()},
        {"blueprint_list", c.blueprint_list.generic_string()},
        {"blueprint_base", c.blueprint_base.generic_string()}
    };
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"potcheck", levelName(c.potcheck)},
        {"manifest", levelName(c.manifest)},
        {"scan", levelName(c.scan)},
        {"check", levelName(c.check)},
        {"git", levelName(c.git)},
        {"blueprint", levelName(c.blueprint)},
        {"cli", levelName(c.cli)}
    };
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"file", c.file},
        {"levels", c.levels}
    };
}

void to_json(nlohmann::json& j, const OutputConfig& c) {
    j = {{"color", c.color}};
}

} // namespace pc::config
