#pragma once

#include "types/UploadTask.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wb::storage { class KeyValueStore; }

namespace wb::upload {

// Durable list of upload tasks kept under a single key. Every call re-reads the
// persisted list; mutations go through the key-value store's atomic update.
class TaskStore {
public:
    static constexpr const char* QUEUE_KEY = "upload_queue";

    explicit TaskStore(std::shared_ptr<storage::KeyValueStore> kv, unsigned int maxRetries = 3);

    // False if a task with the same id already exists.
    bool add(const types::UploadTask& task);

    [[nodiscard]] std::vector<types::UploadTask> getAll() const;
    [[nodiscard]] std::optional<types::UploadTask> get(const std::string& id) const;

    // Not completed and retryCount < maxRetries, in queue order.
    [[nodiscard]] std::vector<types::UploadTask> getPending() const;

    // Replaces the stored task with the same id. False if unknown.
    bool update(const types::UploadTask& task);

    // Sets status uploading. `uploaded` is clamped to `total` and never moves
    // backwards unless `token` names a new session.
    bool updateProgress(const std::string& id, uint64_t uploaded, uint64_t total,
                        const std::optional<std::string>& token = std::nullopt);

    bool markUploading(const std::string& id);

    // Idempotent; a second call keeps the original completedAt.
    bool completeTask(const std::string& id);

    bool failTask(const std::string& id, const std::string& message);

    bool remove(const std::string& id);

    // Drops completed tasks whose completedAt is at least `grace` old. Returns the count removed.
    size_t pruneCompleted(std::chrono::milliseconds grace);

    // Drops completed tasks and failed tasks that exhausted their retries.
    size_t clearFinished();

    size_t clearAll();

    [[nodiscard]] bool hasPending() const;

    [[nodiscard]] unsigned int maxRetries() const { return maxRetries_; }

private:
    std::shared_ptr<storage::KeyValueStore> kv_;
    unsigned int maxRetries_;

    [[nodiscard]] static std::vector<types::UploadTask> decode_(const std::optional<std::string>& raw);
    [[nodiscard]] static std::string encode_(const std::vector<types::UploadTask>& tasks);

    // Runs fn over the persisted list under the store's lock; writes back when fn returns true.
    bool mutate_(const std::function<bool(std::vector<types::UploadTask>&)>& fn);

    bool mutateTask_(const std::string& id, const std::function<void(types::UploadTask&)>& fn);
};

}
