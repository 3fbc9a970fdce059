#include "jobs/InlineScheduler.hpp"
#include "log/Registry.hpp"

using namespace wb::jobs;
using namespace wb::log;

void InlineScheduler::registerWorker(const std::string& name, JobHandler handler) {
    std::scoped_lock lock(mutex_);
    workers_[name] = std::move(handler);
}

bool InlineScheduler::registerOneOffJob(const JobRequest& req) {
    JobHandler handler;
    {
        std::scoped_lock lock(mutex_);
        const auto it = workers_.find(req.name);
        if (it == workers_.end()) {
            Registry::jobs()->error("[InlineScheduler] No worker registered for {}", req.name);
            return false;
        }
        if (!running_.insert(req.id).second) return false;
        handler = it->second;
    }

    bool done = false;
    try {
        done = handler(req.payload);
    } catch (const std::exception& e) {
        Registry::jobs()->error("[InlineScheduler] Job {} threw: {}", req.id, e.what());
    }

    if (!done) Registry::jobs()->info("[InlineScheduler] Job {} wants a retry; it runs again on the next startup recovery sweep", req.id);

    std::scoped_lock lock(mutex_);
    running_.erase(req.id);
    return true;
}

bool InlineScheduler::cancelJob(const std::string&) {
    return false;
}

size_t InlineScheduler::cancelJobsByTag(const std::string&) {
    return 0;
}
