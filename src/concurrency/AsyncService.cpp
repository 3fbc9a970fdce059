#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace wb::concurrency;
using namespace wb::log;

AsyncService::AsyncService(std::string serviceName) : serviceName_(std::move(serviceName)) {}

AsyncService::~AsyncService() {
    stop(); // ensure cleanup
}

void AsyncService::start() {
    if (isRunning()) return;

    interruptFlag_.store(false);
    running_.store(true);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            Registry::witness()->error("[{}] Service encountered an error: {}", serviceName_, e.what());
        }
        running_.store(false);
    });

    Registry::witness()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    Registry::witness()->info("[{}] Stopping service...", serviceName_);
    interruptFlag_.store(true);
    wake_();

    // Only join if we're not calling stop() from the same thread
    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();
    else worker_.detach();

    running_.store(false);
    interruptFlag_.store(false);

    Registry::witness()->info("[{}] Service stopped.", serviceName_);
}

bool AsyncService::waitFor_(const std::chrono::milliseconds d) {
    std::unique_lock lock(waitMutex_);
    waitCv_.wait_for(lock, d, [this] { return woken_ || interruptFlag_.load(); });
    woken_ = false;
    return !interruptFlag_.load();
}

void AsyncService::wake_() {
    {
        std::scoped_lock lock(waitMutex_);
        woken_ = true;
    }
    waitCv_.notify_all();
}
