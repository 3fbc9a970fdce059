#pragma once

#include "concurrency/AsyncService.hpp"

#include <chrono>
#include <memory>

namespace wb::upload {

class ProgressPublisher;

class ProgressPoller final : public concurrency::AsyncService {
public:
    ProgressPoller(std::shared_ptr<ProgressPublisher> publisher, std::chrono::milliseconds interval);
    ~ProgressPoller() override;

protected:
    void runLoop() override;

private:
    std::shared_ptr<ProgressPublisher> publisher_;
    std::chrono::milliseconds interval_;
};

}
