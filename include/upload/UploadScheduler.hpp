#pragma once

#include "config/Config.hpp"
#include "jobs/JobScheduler.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace wb::cloud { class ProviderRegistry; }

namespace wb::upload {

class TaskStore;

// Creates upload tasks, hands them to the job facility and runs them to a terminal
// state. The scheduler must outlive the job facility it registers its worker with.
class UploadScheduler {
public:
    static constexpr const char* JOB_NAME = "upload";
    static constexpr const char* JOB_TAG = "upload";

    UploadScheduler(std::shared_ptr<TaskStore> store,
                    std::shared_ptr<cloud::ProviderRegistry> providers,
                    std::shared_ptr<jobs::JobScheduler> jobs,
                    config::UploadConfig cfg);

    // Throws std::invalid_argument when the file is missing or the backend is unknown.
    std::string scheduleUpload(const std::filesystem::path& filePath, const std::string& fileName,
                               const std::string& backendId);

    // One attempt. True only when the task is (or already was) completed.
    bool processTask(const std::string& taskId);

    // Worker body. An empty id picks the first pending task. True when no re-run is wanted.
    bool handleJob(const std::string& taskId);

    // Prunes expired completions, then registers a job for every task that can still run.
    size_t recoverPending();

    // Registers jobs for tasks still in `pending`, e.g. enqueued by another process.
    size_t adoptNewTasks();

    // Does not interrupt a transfer already in flight.
    bool cancel(const std::string& taskId);
    size_t cancelAll();

    [[nodiscard]] jobs::JobRequest jobFor(const std::string& taskId) const;

    [[nodiscard]] const std::shared_ptr<TaskStore>& store() const { return store_; }

private:
    enum class Outcome { Completed, Retry, Dropped, Halted };

    std::shared_ptr<TaskStore> store_;
    std::shared_ptr<cloud::ProviderRegistry> providers_;
    std::shared_ptr<jobs::JobScheduler> jobs_;
    config::UploadConfig cfg_;

    Outcome process_(const std::string& taskId);
};

}
