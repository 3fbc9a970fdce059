#include "config/ConfigRegistry.hpp"

#include <cstdlib>
#include <stdexcept>

namespace wb::config {

std::filesystem::path resolveConfigPath(const std::filesystem::path& cliOverride) {
    if (!cliOverride.empty()) return cliOverride;
    if (const char* env = std::getenv(CONFIG_PATH_ENV); env && *env) return env;
    return DEFAULT_CONFIG_PATH;
}

void ConfigRegistry::init(const std::filesystem::path& path) {
    std::call_once(init_flag_, [&]() {
        config_ = loadConfig(path);
        initialized_ = true;
    });
}

void ConfigRegistry::init(Config config) {
    std::call_once(init_flag_, [&]() {
        config_ = std::move(config);
        initialized_ = true;
    });
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

}
