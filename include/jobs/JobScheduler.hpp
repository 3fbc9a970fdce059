#pragma once

#include "jobs/BackoffPolicy.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace wb::jobs {

struct Constraints {
    bool requiresNetwork = false;
};

struct JobRequest {
    std::string id;       // unique name; a second registration with a live id is ignored
    std::string name;     // selects the worker
    std::string tag;
    std::string payload;
    Constraints constraints;
    BackoffPolicy backoff;
    std::chrono::milliseconds initialDelay{0};
};

// Returns true when the job is done; false asks for a re-run after backoff.
using JobHandler = std::function<bool(const std::string& payload)>;

class JobScheduler {
public:
    virtual ~JobScheduler() = default;

    virtual void registerWorker(const std::string& name, JobHandler handler) = 0;

    // False when a job with the same id is already queued or running.
    virtual bool registerOneOffJob(const JobRequest& req) = 0;

    virtual bool cancelJob(const std::string& id) = 0;

    virtual size_t cancelJobsByTag(const std::string& tag) = 0;
};

}
