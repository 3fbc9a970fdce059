#pragma once

#include "jobs/JobScheduler.hpp"

#include <mutex>
#include <unordered_map>
#include <unordered_set>

namespace wb::jobs {

// Runs each job synchronously inside registerOneOffJob, once. No backoff, no constraints.
class InlineScheduler final : public JobScheduler {
public:
    void registerWorker(const std::string& name, JobHandler handler) override;
    bool registerOneOffJob(const JobRequest& req) override;
    bool cancelJob(const std::string& id) override;
    size_t cancelJobsByTag(const std::string& tag) override;

private:
    std::mutex mutex_;
    std::unordered_map<std::string, JobHandler> workers_;
    std::unordered_set<std::string> running_;
};

}
