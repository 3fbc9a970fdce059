#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>

namespace wb::config {

constexpr static const auto* DEFAULT_CONFIG_PATH = "/etc/witnessbackup/config.yaml";
constexpr static const auto* CONFIG_PATH_ENV = "WITNESSBACKUP_CONFIG";

// --config wins over $WITNESSBACKUP_CONFIG, which wins over the default path.
std::filesystem::path resolveConfigPath(const std::filesystem::path& cliOverride = {});

class ConfigRegistry {
public:
    static void init(const std::filesystem::path& path = resolveConfigPath());
    static void init(Config config);
    static const Config& get();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

}
