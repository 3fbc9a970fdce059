#pragma once

#include "jobs/JobScheduler.hpp"
#include "concurrency/AsyncService.hpp"
#include "concurrency/ThreadPool.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace wb::jobs {

// In-process deferred job facility: a min-heap on next run time drained by a
// dispatcher thread into a worker pool. Jobs live as long as the process.
class JobRunner final : public JobScheduler, public concurrency::AsyncService {
public:
    using Clock = std::chrono::steady_clock;
    using NetworkProbe = std::function<bool()>;

    explicit JobRunner(unsigned int workerThreads,
                       NetworkProbe networkProbe = {},
                       std::chrono::milliseconds networkRecheck = std::chrono::seconds(15));
    ~JobRunner() override;

    void registerWorker(const std::string& name, JobHandler handler) override;
    bool registerOneOffJob(const JobRequest& req) override;
    bool cancelJob(const std::string& id) override;
    size_t cancelJobsByTag(const std::string& tag) override;

    void stop() override;

    [[nodiscard]] bool isScheduled(const std::string& id) const;

    // Blocks until nothing is queued or running, or the timeout passes.
    bool waitIdle(std::chrono::milliseconds timeout);

protected:
    void runLoop() override;

private:
    struct Job {
        JobRequest request;
        Clock::time_point nextRun;
        unsigned int attempt = 0;
        bool cancelled = false;
    };

    struct JobCompare {
        bool operator()(const std::shared_ptr<Job>& a, const std::shared_ptr<Job>& b) const {
            return a->nextRun > b->nextRun; // Min-heap based on nextRun
        }
    };

    class JobTask;

    NetworkProbe networkProbe_;
    std::chrono::milliseconds networkRecheck_;

    mutable std::mutex mutex_;
    std::condition_variable idleCv_;
    std::priority_queue<std::shared_ptr<Job>, std::vector<std::shared_ptr<Job>>, JobCompare> pq_;
    std::unordered_map<std::string, std::shared_ptr<Job>> jobs_;
    std::unordered_map<std::string, JobHandler> workers_;
    std::unordered_set<std::string> inFlight_;

    concurrency::ThreadPool pool_;

    void execute_(const std::shared_ptr<Job>& job);
};

}
