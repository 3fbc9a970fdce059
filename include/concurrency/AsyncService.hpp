#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace wb::concurrency {

class AsyncService {
public:
    explicit AsyncService(std::string serviceName);

    virtual ~AsyncService();

    virtual void start();

    virtual void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    [[nodiscard]] const std::string& name() const { return serviceName_; }

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    virtual void runLoop() = 0;

    // Sleeps up to `d`; returns false as soon as stop() is requested.
    bool waitFor_(std::chrono::milliseconds d);

    // Wakes a waitFor_() early without stopping the service.
    void wake_();

private:
    std::mutex waitMutex_;
    std::condition_variable waitCv_;
    bool woken_ = false;
};

}
