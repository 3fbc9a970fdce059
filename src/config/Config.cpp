#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <filesystem>
#include <yaml-cpp/yaml.h>

namespace wb::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    if (path.empty() || !std::filesystem::exists(path)) {
        spdlog::warn("[Config] No config file at '{}', using defaults", path.string());
        return cfg;
    }

    const YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["state"]) YAML::convert<StateConfig>::decode(node, cfg.state);
    if (auto node = root["upload"]) YAML::convert<UploadConfig>::decode(node, cfg.upload);
    if (auto node = root["http"]) YAML::convert<HttpConfig>::decode(node, cfg.http);
    if (auto node = root["providers"]) YAML::convert<ProvidersConfig>::decode(node, cfg.providers);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

}
