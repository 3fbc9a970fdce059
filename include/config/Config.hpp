#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace wb::config {

constexpr static uint64_t MiB = 1024 * 1024;

struct StateConfig {
    std::filesystem::path directory = "/var/lib/witnessbackup";
};

struct UploadConfig {
    unsigned int max_retries = 3;
    std::chrono::milliseconds completed_grace = std::chrono::seconds(2);
    std::chrono::seconds backoff_initial = std::chrono::seconds(30);
    std::chrono::seconds backoff_max = std::chrono::hours(5);
    std::chrono::milliseconds poll_interval = std::chrono::seconds(1);
    std::chrono::seconds rescan_interval = std::chrono::seconds(60);
    bool requires_network = true;
    bool immediate = false; // run jobs in-process on the scheduling thread
    unsigned int worker_threads = 2;
};

struct HttpConfig {
    long connect_timeout_seconds = 30;
    long low_speed_time_seconds = 60;  // abort when below low_speed_limit for this long
    long low_speed_limit_bytes = 1;
    std::string user_agent = "witnessbackup/0.1";
};

struct GoogleDriveConfig {
    std::string upload_endpoint = "https://www.googleapis.com";
    std::string folder_id;  // empty => My Drive root
    uint64_t resumable_threshold_bytes = 5 * MiB;
    uint64_t chunk_size_bytes = 8 * MiB;
};

struct CommitPolicy {
    std::string mode = "add";
    bool autorename = true;
    bool mute = false;
};

struct DropboxConfig {
    std::string content_endpoint = "https://content.dropboxapi.com/2";
    std::string folder;  // "" => app folder root
    uint64_t session_threshold_bytes = 150 * MiB;
    uint64_t chunk_size_bytes = 8 * MiB;
    CommitPolicy commit;
};

struct WebDAVConfig {
    uint64_t chunk_size_bytes = 5 * MiB;
    bool auto_rename = false;
};

struct ProvidersConfig {
    GoogleDriveConfig google_drive;
    DropboxConfig dropbox;
    WebDAVConfig webdav;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum witness = spdlog::level::info;  // Startup/shutdown, scheduling decisions
    spdlog::level::level_enum upload  = spdlog::level::info;  // Task processing and retries
    spdlog::level::level_enum store   = spdlog::level::warn;  // Corrupt records, persistence failures
    spdlog::level::level_enum cloud   = spdlog::level::info;  // Backend protocol steps
    spdlog::level::level_enum http    = spdlog::level::warn;  // Transport errors
    spdlog::level::level_enum jobs    = spdlog::level::info;  // Job dispatch and backoff
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/witnessbackup";
    LogLevelsConfig levels;
};

struct Config {
    StateConfig state;
    UploadConfig upload;
    HttpConfig http;
    ProvidersConfig providers;
    LoggingConfig logging;
};

// Missing file => defaults. Malformed YAML throws YAML::Exception.
Config loadConfig(const std::filesystem::path& path);

}
