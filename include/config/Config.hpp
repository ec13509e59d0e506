#pragma once

#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace pc::config {

// A file extension and the pattern (ECMAScript regex, matched per line) marking translatable text in it
struct MarkerConfig {
    std::string extension;
    std::string pattern;
};

struct PotfilesConfig {
    std::filesystem::path manifest = "po/POTFILES.in";
    std::filesystem::path skip = "po/POTFILES.skip";
    std::filesystem::path scan_root = "src";
    MarkerConfig ui{".ui", R"(translatable="yes")"};
    MarkerConfig blueprint{".blp", R"(_\()"};
    MarkerConfig source{".rs", R"(gettext(_f)?\()"};
    std::string disallowed_macro = R"(gettext!\()";
};

struct ResourcesConfig {
    bool enabled = true;
    std::filesystem::path gresource = "data/resources/resources.gresource.xml";
    std::filesystem::path blueprint_list = "src/ui-blueprint-resources.in";
    std::filesystem::path blueprint_base = "src";
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum potcheck  = spdlog::level::info;
    spdlog::level::level_enum manifest  = spdlog::level::info;
    spdlog::level::level_enum scan      = spdlog::level::info;   // one debug line per matched file
    spdlog::level::level_enum check     = spdlog::level::info;
    spdlog::level::level_enum git       = spdlog::level::info;
    spdlog::level::level_enum blueprint = spdlog::level::info;
    spdlog::level::level_enum cli       = spdlog::level::info;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::warn;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::string file;   // empty = console only
    LogLevelsConfig levels;
};

struct OutputConfig {
    bool color = true;
};

struct Config {
    PotfilesConfig potfiles;
    ResourcesConfig resources;
    LoggingConfig logging;
    OutputConfig output;
};

Config loadConfig(const std::filesystem::path& path);
Config loadConfigFromString(const std::string& yaml);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const MarkerConfig& c);
void to_json(nlohmann::json& j, const PotfilesConfig& c);
void to_json(nlohmann::json& j, const ResourcesConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void to_json(nlohmann::json& j, const OutputConfig& c);

} // namespace pc::config
