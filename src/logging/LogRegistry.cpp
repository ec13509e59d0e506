#include "logging/LogRegistry.hpp"
#include "config/ConfigRegistry.hpp"

#include <stdexcept>
#include <vector>

namespace pc::logging {

void LogRegistry::init() {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    const auto& cnf = config::ConfigRegistry::get().logging;

    // console on stderr; stdout carries the report
    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(CONSOLE_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    if (!cnf.file.empty()) {
        file_sink_ = openFileSink(cnf.file);
        file_sink_->set_level(cnf.levels.file_log_level);
        file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(file_sink_);
    }

    auto makeLogger = [&](const std::string& name,
                          const spdlog::level::level_enum lvl = spdlog::level::debug) {
        if (spdlog::get(name)) spdlog::drop(name);
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("potcheck",  sub_levels.potcheck);
    makeLogger("manifest",  sub_levels.manifest);
    makeLogger("scan",      sub_levels.scan);
    makeLogger("check",     sub_levels.check);
    makeLogger("git",       sub_levels.git);
    makeLogger("blueprint", sub_levels.blueprint);
    makeLogger("cli",       sub_levels.cli);

    initialized_ = true;
    get("potcheck")->debug("[LogRegistry] Initialized");
}

std::shared_ptr<spdlog::sinks::basic_file_sink_mt> LogRegistry::openFileSink(const std::filesystem::path& file) {
    try {
        if (file.has_parent_path() && !std::filesystem::exists(file.parent_path()))
            std::filesystem::create_directories(file.parent_path());
        return std::make_shared<spdlog::sinks::basic_file_sink_mt>(file.string(), /*truncate=*/false);
    } catch (const std::filesystem::filesystem_error& e) {
        throw std::runtime_error("Cannot create log directory for " + file.string() + ": " + e.code().message());
    } catch (const spdlog::spdlog_ex& e) {
        throw std::runtime_error("Cannot open log file " + file.string() + ": " + e.what());
    }
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

void LogRegistry::setConsoleLevel(const spdlog::level::level_enum lvl) {
    if (!initialized_) return;
    console_sink_->set_level(lvl);
    spdlog::apply_all([lvl](const std::shared_ptr<spdlog::logger>& lg) {
        if (lg->level() > lvl) lg->set_level(lvl);
    });
}

bool LogRegistry::isInitialized() { return initialized_; }

} // namespace pc::logging
