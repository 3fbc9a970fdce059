#include "upload/TaskStore.hpp"
#include "storage/KeyValueStore.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace wb::upload;
using namespace wb::types;
using namespace wb::log;
using json = nlohmann::json;

TaskStore::TaskStore(std::shared_ptr<storage::KeyValueStore> kv, const unsigned int maxRetries)
    : kv_(std::move(kv)), maxRetries_(maxRetries) {
    if (!kv_) throw std::invalid_argument("TaskStore requires a key-value store");
}

std::vector<UploadTask> TaskStore::decode_(const std::optional<std::string>& raw) {
    if (!raw || raw->empty()) return {};
    try {
        return json::parse(*raw).get<std::vector<UploadTask>>();
    } catch (const std::exception& e) {
        Registry::store()->error("[TaskStore] Unreadable {} record, treating queue as empty: {}", QUEUE_KEY, e.what());
        return {};
    }
}

std::string TaskStore::encode_(const std::vector<UploadTask>& tasks) {
    return json(tasks).dump();
}

bool TaskStore::mutate_(const std::function<bool(std::vector<UploadTask>&)>& fn) {
    bool changed = false;
    kv_->update(QUEUE_KEY, [&](const std::optional<std::string>& current) -> std::optional<std::string> {
        auto tasks = decode_(current);
        changed = fn(tasks);
        if (!changed) return current;
        return encode_(tasks);
    });
    return changed;
}

bool TaskStore::mutateTask_(const std::string& id, const std::function<void(UploadTask&)>& fn) {
    return mutate_([&](std::vector<UploadTask>& tasks) {
        const auto it = std::ranges::find_if(tasks, [&](const UploadTask& t) { return t.id == id; });
        if (it == tasks.end()) return false;
        fn(*it);
        return true;
    });
}

bool TaskStore::add(const UploadTask& task) {
    const bool added = mutate_([&](std::vector<UploadTask>& tasks) {
        if (std::ranges::any_of(tasks, [&](const UploadTask& t) { return t.id == task.id; })) return false;
        tasks.push_back(task);
        return true;
    });
    if (added) Registry::store()->debug("[TaskStore] Added task {} ({})", task.id, task.fileName);
    return added;
}

std::vector<UploadTask> TaskStore::getAll() const {
    return decode_(kv_->get(QUEUE_KEY));
}

std::optional<UploadTask> TaskStore::get(const std::string& id) const {
    for (auto& t : getAll())
        if (t.id == id) return t;
    return std::nullopt;
}

std::vector<UploadTask> TaskStore::getPending() const {
    std::vector<UploadTask> pending;
    for (auto& t : getAll())
        if (t.isPending(maxRetries_)) pending.push_back(std::move(t));
    return pending;
}

bool TaskStore::update(const UploadTask& task) {
    return mutateTask_(task.id, [&](UploadTask& t) {
        const auto retries = std::max(t.retryCount, task.retryCount);
        t = task;
        t.retryCount = retries;
    });
}

bool TaskStore::updateProgress(const std::string& id, uint64_t uploaded, const uint64_t total,
                               const std::optional<std::string>& token) {
    return mutateTask_(id, [&](UploadTask& t) {
        const bool newSession = token && t.resumeToken != token;
        if (total > 0) uploaded = std::min(uploaded, total);
        if (!newSession && t.uploadedBytes) uploaded = std::max(uploaded, *t.uploadedBytes);

        t.uploadedBytes = uploaded;
        t.totalBytes = total;
        if (token) t.resumeToken = token;
        if (t.status != UploadTask::Status::Completed) t.status = UploadTask::Status::Uploading;
    });
}

bool TaskStore::markUploading(const std::string& id) {
    return mutateTask_(id, [](UploadTask& t) {
        t.status = UploadTask::Status::Uploading;
        t.errorMessage.reset();
    });
}

bool TaskStore::completeTask(const std::string& id) {
    return mutateTask_(id, [](UploadTask& t) {
        if (t.status == UploadTask::Status::Completed && t.completedAt) return;
        t.status = UploadTask::Status::Completed;
        t.errorMessage.reset();
        t.completedAt = std::chrono::system_clock::now();
        if (t.totalBytes) t.uploadedBytes = t.totalBytes;
    });
}

bool TaskStore::failTask(const std::string& id, const std::string& message) {
    const bool found = mutateTask_(id, [&](UploadTask& t) {
        t.status = UploadTask::Status::Failed;
        t.errorMessage = message;
        ++t.retryCount;
    });
    if (found) Registry::store()->debug("[TaskStore] Task {} failed: {}", id, message);
    return found;
}

bool TaskStore::remove(const std::string& id) {
    return mutate_([&](std::vector<UploadTask>& tasks) {
        return std::erase_if(tasks, [&](const UploadTask& t) { return t.id == id; }) > 0;
    });
}

size_t TaskStore::pruneCompleted(const std::chrono::milliseconds grace) {
    const auto now = std::chrono::system_clock::now();
    size_t removed = 0;
    mutate_([&](std::vector<UploadTask>& tasks) {
        removed = std::erase_if(tasks, [&](const UploadTask& t) {
            if (t.status != UploadTask::Status::Completed) return false;
            return !t.completedAt || now - *t.completedAt >= grace;
        });
        return removed > 0;
    });
    if (removed) Registry::store()->debug("[TaskStore] Pruned {} completed task(s)", removed);
    return removed;
}

size_t TaskStore::clearFinished() {
    size_t removed = 0;
    mutate_([&](std::vector<UploadTask>& tasks) {
        removed = std::erase_if(tasks, [&](const UploadTask& t) { return t.isTerminal(maxRetries_); });
        return removed > 0;
    });
    return removed;
}

size_t TaskStore::clearAll() {
    size_t removed = 0;
    mutate_([&](std::vector<UploadTask>& tasks) {
        removed = tasks.size();
        tasks.clear();
        return removed > 0;
    });
    return removed;
}

bool TaskStore::hasPending() const {
    return std::ranges::any_of(getAll(), [&](const UploadTask& t) { return t.isPending(maxRetries_); });
}
