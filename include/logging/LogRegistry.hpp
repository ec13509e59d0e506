#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace pc::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels from ConfigRegistry.
    // Throws std::runtime_error if the configured log file cannot be opened.
    static void init();

    // Appending file sink; creates the parent directory. Throws std::runtime_error naming the file.
    static std::shared_ptr<spdlog::sinks::basic_file_sink_mt> openFileSink(const std::filesystem::path& file);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> potcheck()  { return get("potcheck"); }
    static std::shared_ptr<spdlog::logger> manifest()  { return get("manifest"); }
    static std::shared_ptr<spdlog::logger> scan()      { return get("scan"); }
    static std::shared_ptr<spdlog::logger> check()     { return get("check"); }
    static std::shared_ptr<spdlog::logger> git()       { return get("git"); }
    static std::shared_ptr<spdlog::logger> blueprint() { return get("blueprint"); }
    static std::shared_ptr<spdlog::logger> cli()       { return get("cli"); }

    // Lowers (or raises) the console sink and every logger to lvl; used by --verbose.
    static void setConsoleLevel(spdlog::level::level_enum lvl);

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
    static constexpr const auto* CONSOLE_FORMAT = "[%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_sink_;
};

} // namespace pc::logging
