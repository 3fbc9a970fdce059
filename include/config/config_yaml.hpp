#pragma once

#include "config/Config.hpp"

#include <string>
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace wb::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<StateConfig> {
    static Node encode(const StateConfig& rhs) {
        Node node;
        node["directory"] = rhs.directory.string();
        return node;
    }

    static bool decode(const Node& node, StateConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.directory = node["directory"].as<std::string>("/var/lib/witnessbackup");
        return true;
    }
};

template<>
struct convert<UploadConfig> {
    static Node encode(const UploadConfig& rhs) {
        Node node;
        node["max_retries"] = rhs.max_retries;
        node["completed_grace_ms"] = rhs.completed_grace.count();
        node["backoff_initial_seconds"] = rhs.backoff_initial.count();
        node["backoff_max_seconds"] = rhs.backoff_max.count();
        node["poll_interval_ms"] = rhs.poll_interval.count();
        node["rescan_interval_seconds"] = rhs.rescan_interval.count();
        node["requires_network"] = rhs.requires_network;
        node["immediate"] = rhs.immediate;
        node["worker_threads"] = rhs.worker_threads;
        return node;
    }

    static bool decode(const Node& node, UploadConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_retries = node["max_retries"].as<unsigned int>(3);
        rhs.completed_grace = std::chrono::milliseconds(node["completed_grace_ms"].as<long>(2000));
        rhs.backoff_initial = std::chrono::seconds(node["backoff_initial_seconds"].as<long>(30));
        rhs.backoff_max = std::chrono::seconds(node["backoff_max_seconds"].as<long>(5 * 60 * 60));
        rhs.poll_interval = std::chrono::milliseconds(node["poll_interval_ms"].as<long>(1000));
        rhs.rescan_interval = std::chrono::seconds(node["rescan_interval_seconds"].as<long>(60));
        rhs.requires_network = node["requires_network"].as<bool>(true);
        rhs.immediate = node["immediate"].as<bool>(false);
        rhs.worker_threads = node["worker_threads"].as<unsigned int>(2);
        if (rhs.worker_threads == 0) rhs.worker_threads = 1;
        return true;
    }
};

template<>
struct convert<HttpConfig> {
    static Node encode(const HttpConfig& rhs) {
        Node node;
        node["connect_timeout_seconds"] = rhs.connect_timeout_seconds;
        node["low_speed_time_seconds"] = rhs.low_speed_time_seconds;
        node["low_speed_limit_bytes"] = rhs.low_speed_limit_bytes;
        node["user_agent"] = rhs.user_agent;
        return node;
    }

    static bool decode(const Node& node, HttpConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.connect_timeout_seconds = node["connect_timeout_seconds"].as<long>(30);
        rhs.low_speed_time_seconds = node["low_speed_time_seconds"].as<long>(60);
        rhs.low_speed_limit_bytes = node["low_speed_limit_bytes"].as<long>(1);
        rhs.user_agent = node["user_agent"].as<std::string>("witnessbackup/0.1");
        return true;
    }
};

template<>
struct convert<GoogleDriveConfig> {
    static Node encode(const GoogleDriveConfig& rhs) {
        Node node;
        node["upload_endpoint"] = rhs.upload_endpoint;
        node["folder_id"] = rhs.folder_id;
        node["resumable_threshold_mb"] = rhs.resumable_threshold_bytes / MiB;
        node["chunk_size_mb"] = rhs.chunk_size_bytes / MiB;
        return node;
    }

    static bool decode(const Node& node, GoogleDriveConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.upload_endpoint = node["upload_endpoint"].as<std::string>("https://www.googleapis.com");
        rhs.folder_id = node["folder_id"].as<std::string>("");
        rhs.resumable_threshold_bytes = node["resumable_threshold_mb"].as<uint64_t>(5) * MiB;
        rhs.chunk_size_bytes = node["chunk_size_mb"].as<uint64_t>(8) * MiB;
        return true;
    }
};

template<>
struct convert<CommitPolicy> {
    static Node encode(const CommitPolicy& rhs) {
        Node node;
        node["mode"] = rhs.mode;
        node["autorename"] = rhs.autorename;
        node["mute"] = rhs.mute;
        return node;
    }

    static bool decode(const Node& node, CommitPolicy& rhs) {
        if (!node.IsMap()) return false;
        rhs.mode = node["mode"].as<std::string>("add");
        rhs.autorename = node["autorename"].as<bool>(true);
        rhs.mute = node["mute"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<DropboxConfig> {
    static Node encode(const DropboxConfig& rhs) {
        Node node;
        node["content_endpoint"] = rhs.content_endpoint;
        node["folder"] = rhs.folder;
        node["session_threshold_mb"] = rhs.session_threshold_bytes / MiB;
        node["chunk_size_mb"] = rhs.chunk_size_bytes / MiB;
        node["commit"] = rhs.commit;
        return node;
    }

    static bool decode(const Node& node, DropboxConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.content_endpoint = node["content_endpoint"].as<std::string>("https://content.dropboxapi.com/2");
        rhs.folder = node["folder"].as<std::string>("");
        rhs.session_threshold_bytes = node["session_threshold_mb"].as<uint64_t>(150) * MiB;
        rhs.chunk_size_bytes = node["chunk_size_mb"].as<uint64_t>(8) * MiB;
        if (node["commit"]) rhs.commit = node["commit"].as<CommitPolicy>();
        return true;
    }
};

template<>
struct convert<WebDAVConfig> {
    static Node encode(const WebDAVConfig& rhs) {
        Node node;
        node["chunk_size_mb"] = rhs.chunk_size_bytes / MiB;
        node["auto_rename"] = rhs.auto_rename;
        return node;
    }

    static bool decode(const Node& node, WebDAVConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.chunk_size_bytes = node["chunk_size_mb"].as<uint64_t>(5) * MiB;
        rhs.auto_rename = node["auto_rename"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<ProvidersConfig> {
    static Node encode(const ProvidersConfig& rhs) {
        Node node;
        node["google_drive"] = rhs.google_drive;
        node["dropbox"] = rhs.dropbox;
        node["webdav"] = rhs.webdav;
        return node;
    }

    static bool decode(const Node& node, ProvidersConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["google_drive"]) rhs.google_drive = node["google_drive"].as<GoogleDriveConfig>();
        if (node["dropbox"]) rhs.dropbox = node["dropbox"].as<DropboxConfig>();
        if (node["webdav"]) rhs.webdav = node["webdav"].as<WebDAVConfig>();
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["witness"] = to_std_string(spdlog::level::to_string_view(rhs.witness));
        node["upload"]  = to_std_string(spdlog::level::to_string_view(rhs.upload));
        node["store"]   = to_std_string(spdlog::level::to_string_view(rhs.store));
        node["cloud"]   = to_std_string(spdlog::level::to_string_view(rhs.cloud));
        node["http"]    = to_std_string(spdlog::level::to_string_view(rhs.http));
        node["jobs"]    = to_std_string(spdlog::level::to_string_view(rhs.jobs));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.witness = spdlog::level::from_str(node["witness"].as<std::string>("info"));
        rhs.upload = spdlog::level::from_str(node["upload"].as<std::string>("info"));
        rhs.store = spdlog::level::from_str(node["store"].as<std::string>("warning"));
        rhs.cloud = spdlog::level::from_str(node["cloud"].as<std::string>("info"));
        rhs.http = spdlog::level::from_str(node["http"].as<std::string>("warning"));
        rhs.jobs = spdlog::level::from_str(node["jobs"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/witnessbackup");
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
