#pragma once

#include "types/UploadTask.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace wb::upload {

class TaskStore;

// Re-reads the task store and pushes full snapshots to subscribers. No deltas.
class ProgressPublisher {
public:
    using Snapshot = std::vector<types::UploadTask>;
    using Listener = std::function<void(const Snapshot&)>;

    // Unsubscribes on destruction. Safe to outlive the publisher.
    class Subscription {
    public:
        Subscription() = default;
        ~Subscription();

        Subscription(Subscription&& other) noexcept;
        Subscription& operator=(Subscription&& other) noexcept;
        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        void reset();

    private:
        friend class ProgressPublisher;
        struct State;

        Subscription(std::weak_ptr<State> state, uint64_t id);

        std::weak_ptr<State> state_;
        uint64_t id_{};
    };

    explicit ProgressPublisher(std::shared_ptr<TaskStore> store);

    // Reads the store, remembers the snapshot and delivers it to every listener.
    Snapshot refresh();

    [[nodiscard]] Subscription subscribe(Listener listener);

    [[nodiscard]] Snapshot latest() const;

    [[nodiscard]] size_t subscriberCount() const;

private:
    std::shared_ptr<TaskStore> store_;
    std::shared_ptr<Subscription::State> state_;
};

struct ProgressPublisher::Subscription::State {
    mutable std::mutex mutex;
    std::unordered_map<uint64_t, Listener> listeners;
    uint64_t nextId = 1;
    Snapshot latest;
};

}
