#include "upload/ProgressPoller.hpp"
#include "upload/ProgressPublisher.hpp"
#include "log/Registry.hpp"

using namespace wb::upload;
using namespace wb::log;

ProgressPoller::ProgressPoller(std::shared_ptr<ProgressPublisher> publisher, const std::chrono::milliseconds interval)
    : AsyncService("ProgressPoller"), publisher_(std::move(publisher)), interval_(interval) {}

ProgressPoller::~ProgressPoller() { stop(); }

void ProgressPoller::runLoop() {
    while (!interruptFlag_.load()) {
        try {
            publisher_->refresh();
        } catch (const std::exception& e) {
            Registry::upload()->error("[ProgressPoller] Refresh failed: {}", e.what());
        }
        if (!waitFor_(interval_)) break;
    }
}
