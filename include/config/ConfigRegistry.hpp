#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>
#include <optional>

namespace pc::config {

class ConfigRegistry {
public:
    // Loads the file if given, otherwise keeps the built-in defaults. Only the first call has an effect.
    static void init(const std::optional<std::filesystem::path>& path = std::nullopt);
    static const Config& get();

    [[nodiscard]] static bool isInitialized();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace pc::config
