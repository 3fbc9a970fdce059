#include "jobs/JobRunner.hpp"
#include "util/network.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace wb::jobs;
using namespace wb::concurrency;
using namespace wb::log;

class JobRunner::JobTask final : public Task {
public:
    JobTask(JobRunner* runner, std::shared_ptr<Job> job) : runner_(runner), job_(std::move(job)) {}

    void operator()() override { runner_->execute_(job_); }

private:
    JobRunner* runner_;
    std::shared_ptr<Job> job_;
};

JobRunner::JobRunner(const unsigned int workerThreads, NetworkProbe networkProbe,
                     const std::chrono::milliseconds networkRecheck)
    : AsyncService("JobRunner"),
      networkProbe_(networkProbe ? std::move(networkProbe) : NetworkProbe(util::hasNetworkConnectivity)),
      networkRecheck_(networkRecheck),
      pool_(workerThreads) {}

JobRunner::~JobRunner() { stop(); }

void JobRunner::stop() {
    AsyncService::stop();
    pool_.stop();
    idleCv_.notify_all();
}

void JobRunner::registerWorker(const std::string& name, JobHandler handler) {
    std::scoped_lock lock(mutex_);
    workers_[name] = std::move(handler);
}

bool JobRunner::registerOneOffJob(const JobRequest& req) {
    {
        std::scoped_lock lock(mutex_);
        if (const auto it = jobs_.find(req.id); it != jobs_.end() && !it->second->cancelled) {
            Registry::jobs()->debug("[JobRunner] Job {} already scheduled, keeping the existing one", req.id);
            return false;
        }

        auto job = std::make_shared<Job>();
        job->request = req;
        job->nextRun = Clock::now() + req.initialDelay;
        jobs_[req.id] = job;
        pq_.push(job);
    }

    Registry::jobs()->debug("[JobRunner] Registered job {} ({})", req.id, req.name);
    wake_();
    return true;
}

bool JobRunner::cancelJob(const std::string& id) {
    std::scoped_lock lock(mutex_);
    const auto it = jobs_.find(id);
    if (it == jobs_.end()) return false;
    it->second->cancelled = true;
    jobs_.erase(it);
    idleCv_.notify_all();
    Registry::jobs()->info("[JobRunner] Cancelled job {}", id);
    return true;
}

size_t JobRunner::cancelJobsByTag(const std::string& tag) {
    std::scoped_lock lock(mutex_);
    const size_t n = std::erase_if(jobs_, [&](const auto& entry) {
        if (entry.second->request.tag != tag) return false;
        entry.second->cancelled = true;
        return true;
    });
    idleCv_.notify_all();
    if (n) Registry::jobs()->info("[JobRunner] Cancelled {} job(s) tagged {}", n, tag);
    return n;
}

bool JobRunner::isScheduled(const std::string& id) const {
    std::scoped_lock lock(mutex_);
    return jobs_.contains(id);
}

bool JobRunner::waitIdle(const std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return idleCv_.wait_for(lock, timeout, [this] { return jobs_.empty() && inFlight_.empty(); });
}

void JobRunner::runLoop() {
    while (!interruptFlag_.load()) {
        std::shared_ptr<Job> due;
        auto sleepFor = std::chrono::milliseconds(1000);

        {
            std::scoped_lock lock(mutex_);
            const auto now = Clock::now();
            while (!pq_.empty()) {
                const auto top = pq_.top();
                if (top->cancelled) {
                    pq_.pop();
                    continue;
                }
                if (top->nextRun > now) {
                    const auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(top->nextRun - now);
                    sleepFor = std::clamp(wait, std::chrono::milliseconds(1), sleepFor);
                    break;
                }
                pq_.pop();
                // one run per id at a time; a replacement waits for the old run to finish
                if (inFlight_.contains(top->request.id)) {
                    top->nextRun = now + std::chrono::milliseconds(250);
                    pq_.push(top);
                    sleepFor = std::chrono::milliseconds(250);
                    break;
                }
                due = top;
                break;
            }
        }

        if (!due) {
            if (!waitFor_(sleepFor)) break;
            continue;
        }

        if (due->request.constraints.requiresNetwork && !networkProbe_()) {
            Registry::jobs()->debug("[JobRunner] No network for job {}, rechecking in {} ms",
                                    due->request.id, networkRecheck_.count());
            std::scoped_lock lock(mutex_);
            due->nextRun = Clock::now() + networkRecheck_;
            pq_.push(due);
            continue;
        }

        {
            std::scoped_lock lock(mutex_);
            if (due->cancelled) continue;
            inFlight_.insert(due->request.id);
        }

        try {
            pool_.submit(std::make_shared<JobTask>(this, due));
        } catch (const std::exception& e) {
            Registry::jobs()->error("[JobRunner] Failed to dispatch job {}: {}", due->request.id, e.what());
            std::scoped_lock lock(mutex_);
            inFlight_.erase(due->request.id);
            return;
        }
    }
}

void JobRunner::execute_(const std::shared_ptr<Job>& job) {
    JobHandler handler;
    {
        std::scoped_lock lock(mutex_);
        if (const auto it = workers_.find(job->request.name); it != workers_.end()) handler = it->second;
    }

    bool done = true;
    if (!handler) {
        Registry::jobs()->error("[JobRunner] No worker registered for {}, dropping job {}", job->request.name, job->request.id);
    } else {
        try {
            done = handler(job->request.payload);
        } catch (const std::exception& e) {
            Registry::jobs()->error("[JobRunner] Job {} threw: {}", job->request.id, e.what());
            done = false;
        }
    }

    {
        std::scoped_lock lock(mutex_);
        inFlight_.erase(job->request.id);

        if (done || job->cancelled) {
            if (const auto it = jobs_.find(job->request.id); it != jobs_.end() && it->second == job) jobs_.erase(it);
        } else {
            ++job->attempt;
            const auto delay = job->request.backoff.delayFor(job->attempt);
            job->nextRun = Clock::now() + delay;
            pq_.push(job);
            Registry::jobs()->info("[JobRunner] Job {} will retry in {} ms (attempt {})",
                                   job->request.id, delay.count(), job->attempt + 1);
        }
    }

    idleCv_.notify_all();
    wake_();
}
