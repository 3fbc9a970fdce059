#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace wb::storage { class KeyValueStore; }
namespace wb::cloud { class ProviderRegistry; }

namespace wb::upload {

class UploadScheduler;
class ProgressPublisher;

// Entry point for the host: reacts to new recordings and to process start.
class Orchestrator {
public:
    static constexpr const char* SELECTED_BACKEND_KEY = "cloud_storage";

    Orchestrator(std::shared_ptr<storage::KeyValueStore> settings,
                 std::shared_ptr<cloud::ProviderRegistry> providers,
                 std::shared_ptr<UploadScheduler> scheduler,
                 std::shared_ptr<ProgressPublisher> publisher);

    // Schedules an upload to the selected backend. nullopt when uploads are off,
    // the selection is unknown or the file cannot be scheduled.
    std::optional<std::string> onFileProduced(const std::filesystem::path& path,
                                              const std::optional<std::string>& name = std::nullopt);

    // Recovery sweep. Returns the number of jobs registered.
    size_t onStartup();

    [[nodiscard]] std::string selectedBackend() const;

    // Throws std::invalid_argument for ids that are neither registered nor "none".
    void selectBackend(const std::string& id);

private:
    std::shared_ptr<storage::KeyValueStore> settings_;
    std::shared_ptr<cloud::ProviderRegistry> providers_;
    std::shared_ptr<UploadScheduler> scheduler_;
    std::shared_ptr<ProgressPublisher> publisher_;
};

}
