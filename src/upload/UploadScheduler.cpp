#include "upload/UploadScheduler.hpp"
#include "upload/TaskStore.hpp"
#include "cloud/ProviderRegistry.hpp"
#include "types/UploadTask.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <stdexcept>
#include <system_error>
#include <thread>
#include <fmt/format.h>

using namespace wb::upload;
using namespace wb::types;
using namespace wb::cloud;
using namespace wb::log;
namespace fs = std::filesystem;

UploadScheduler::UploadScheduler(std::shared_ptr<TaskStore> store,
                                 std::shared_ptr<ProviderRegistry> providers,
                                 std::shared_ptr<jobs::JobScheduler> jobs,
                                 config::UploadConfig cfg)
    : store_(std::move(store)), providers_(std::move(providers)), jobs_(std::move(jobs)), cfg_(std::move(cfg)) {
    if (!store_ || !providers_ || !jobs_) throw std::invalid_argument("UploadScheduler requires a store, providers and a job facility");
    jobs_->registerWorker(JOB_NAME, [this](const std::string& payload) { return handleJob(payload); });
}

wb::jobs::JobRequest UploadScheduler::jobFor(const std::string& taskId) const {
    jobs::JobRequest req;
    req.id = taskId;
    req.name = JOB_NAME;
    req.tag = JOB_TAG;
    req.payload = taskId;
    req.constraints.requiresNetwork = cfg_.requires_network;
    req.backoff.kind = jobs::BackoffPolicy::Kind::Exponential;
    req.backoff.initialDelay = cfg_.backoff_initial;
    req.backoff.maxDelay = cfg_.backoff_max;
    return req;
}

std::string UploadScheduler::scheduleUpload(const fs::path& filePath, const std::string& fileName,
                                            const std::string& backendId) {
    std::error_code ec;
    if (!fs::is_regular_file(filePath, ec)) throw std::invalid_argument("File does not exist: " + filePath.string());
    if (!providers_->contains(backendId)) throw std::invalid_argument("Unknown storage backend: " + backendId);

    const auto now = std::chrono::system_clock::now();
    const auto base = fmt::format("upload_{}", util::toEpochMillis(now));

    UploadTask task(base, filePath.string(), fileName.empty() ? filePath.filename().string() : fileName, backendId, now);
    if (const auto size = fs::file_size(filePath, ec); !ec) task.totalBytes = size;

    for (unsigned int n = 1; !store_->add(task); ++n) task.id = fmt::format("{}_{}", base, n);

    Registry::upload()->info("[UploadScheduler] Scheduled {} ({}) for {}", task.id, task.fileName, backendId);

    if (!jobs_->registerOneOffJob(jobFor(task.id)))
        Registry::upload()->warn("[UploadScheduler] Job for {} was already registered", task.id);

    return task.id;
}

UploadScheduler::Outcome UploadScheduler::process_(const std::string& taskId) {
    const auto task = store_->get(taskId);
    if (!task) {
        Registry::upload()->warn("[UploadScheduler] Task {} not found", taskId);
        return Outcome::Dropped;
    }

    if (task->status == UploadTask::Status::Completed) return Outcome::Completed;

    std::error_code ec;
    if (!fs::exists(task->filePath, ec)) {
        Registry::upload()->warn("[UploadScheduler] Source {} for {} is gone, dropping task", task->filePath, taskId);
        store_->remove(taskId);
        return Outcome::Dropped;
    }

    store_->markUploading(taskId);

    const auto provider = providers_->create(task->backendId);
    if (!provider) {
        store_->failTask(taskId, "Unknown storage backend: " + task->backendId);
        Registry::upload()->error("[UploadScheduler] Task {} names unknown backend {}", taskId, task->backendId);
        return Outcome::Halted;
    }

    if (!provider->isAuthenticated()) {
        store_->failTask(taskId, fmt::format("Not signed in to {}", provider->displayName()));
        Registry::upload()->warn("[UploadScheduler] {} is not authenticated, task {} waits for sign-in",
                                 provider->displayName(), taskId);
        return Outcome::Halted;
    }

    UploadRequest req;
    req.filePath = task->filePath;
    req.fileName = task->fileName;
    if (task->hasResumePoint()) {
        req.resumeToken = task->resumeToken;
        req.startByte = task->uploadedBytes.value_or(0);
    }

    Registry::upload()->info("[UploadScheduler] Uploading {} to {}{}", task->fileName, provider->displayName(),
                             req.resumeToken ? fmt::format(" (resuming at {})", req.startByte.value_or(0)) : "");

    std::string error;
    bool ok = false;
    try {
        ok = provider->uploadFile(req, [&](const uint64_t uploaded, const uint64_t total, const std::optional<std::string>& token) {
            store_->updateProgress(taskId, uploaded, total, token);
        }, error);
    } catch (const std::exception& e) {
        error = e.what();
    }

    if (!ok) {
        store_->failTask(taskId, error.empty() ? "Upload failed" : error);
        Registry::upload()->warn("[UploadScheduler] Attempt for {} failed: {}", taskId, error);
        return Outcome::Retry;
    }

    store_->completeTask(taskId);
    Registry::upload()->info("[UploadScheduler] Uploaded {} to {}", task->fileName, provider->displayName());

    // let observers see the completed state before it disappears
    if (cfg_.completed_grace.count() > 0) std::this_thread::sleep_for(cfg_.completed_grace);
    store_->pruneCompleted(cfg_.completed_grace);

    return Outcome::Completed;
}

bool UploadScheduler::processTask(const std::string& taskId) {
    try {
        return process_(taskId) == Outcome::Completed;
    } catch (const std::exception& e) {
        Registry::upload()->error("[UploadScheduler] Processing {} failed: {}", taskId, e.what());
        store_->failTask(taskId, e.what());
        return false;
    }
}

bool UploadScheduler::handleJob(const std::string& taskId) {
    auto id = taskId;
    if (id.empty()) {
        const auto pending = store_->getPending();
        if (pending.empty()) {
            Registry::upload()->debug("[UploadScheduler] No pending uploads");
            return true;
        }
        id = pending.front().id;
    }

    Outcome outcome;
    try {
        outcome = process_(id);
    } catch (const std::exception& e) {
        Registry::upload()->error("[UploadScheduler] Processing {} failed: {}", id, e.what());
        store_->failTask(id, e.what());
        outcome = Outcome::Retry;
    }

    if (outcome != Outcome::Retry) return true;

    const auto task = store_->get(id);
    if (!task || task->retryCount >= store_->maxRetries()) {
        Registry::upload()->error("[UploadScheduler] Giving up on {} after {} attempts", id, store_->maxRetries());
        return true;
    }
    return false;
}

size_t UploadScheduler::recoverPending() {
    store_->pruneCompleted(cfg_.completed_grace);

    size_t registered = 0;
    for (const auto& t : store_->getPending())
        if (jobs_->registerOneOffJob(jobFor(t.id))) ++registered;

    if (registered) Registry::upload()->info("[UploadScheduler] Recovered {} pending upload(s)", registered);
    return registered;
}

size_t UploadScheduler::adoptNewTasks() {
    size_t adopted = 0;
    for (const auto& t : store_->getAll())
        if (t.status == UploadTask::Status::Pending && jobs_->registerOneOffJob(jobFor(t.id))) ++adopted;

    if (adopted) Registry::upload()->info("[UploadScheduler] Adopted {} new upload(s)", adopted);
    return adopted;
}

bool UploadScheduler::cancel(const std::string& taskId) {
    jobs_->cancelJob(taskId);
    const bool removed = store_->remove(taskId);
    if (removed) Registry::upload()->info("[UploadScheduler] Cancelled {}", taskId);
    return removed;
}

size_t UploadScheduler::cancelAll() {
    jobs_->cancelJobsByTag(JOB_TAG);
    const auto removed = store_->clearAll();
    Registry::upload()->info("[UploadScheduler] Cancelled {} upload(s)", removed);
    return removed;
}
