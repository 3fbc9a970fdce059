#include "upload/ProgressPublisher.hpp"
#include "upload/TaskStore.hpp"
#include "log/Registry.hpp"

#include <utility>

using namespace wb::upload;
using namespace wb::types;
using namespace wb::log;

ProgressPublisher::Subscription::Subscription(std::weak_ptr<State> state, const uint64_t id)
    : state_(std::move(state)), id_(id) {}

ProgressPublisher::Subscription::~Subscription() { reset(); }

ProgressPublisher::Subscription::Subscription(Subscription&& other) noexcept
    : state_(std::move(other.state_)), id_(std::exchange(other.id_, 0)) {}

ProgressPublisher::Subscription& ProgressPublisher::Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        state_ = std::move(other.state_);
        id_ = std::exchange(other.id_, 0);
    }
    return *this;
}

void ProgressPublisher::Subscription::reset() {
    if (const auto state = state_.lock()) {
        std::scoped_lock lock(state->mutex);
        state->listeners.erase(id_);
    }
    state_.reset();
    id_ = 0;
}

ProgressPublisher::ProgressPublisher(std::shared_ptr<TaskStore> store)
    : store_(std::move(store)), state_(std::make_shared<Subscription::State>()) {}

ProgressPublisher::Snapshot ProgressPublisher::refresh() {
    auto snapshot = store_->getAll();

    std::vector<Listener> listeners;
    {
        std::scoped_lock lock(state_->mutex);
        state_->latest = snapshot;
        listeners.reserve(state_->listeners.size());
        for (const auto& [_, l] : state_->listeners) listeners.push_back(l);
    }

    // deliver outside the lock so a listener may unsubscribe itself
    for (const auto& l : listeners) {
        try {
            l(snapshot);
        } catch (const std::exception& e) {
            Registry::upload()->error("[ProgressPublisher] Listener threw: {}", e.what());
        }
    }

    return snapshot;
}

ProgressPublisher::Subscription ProgressPublisher::subscribe(Listener listener) {
    std::scoped_lock lock(state_->mutex);
    const auto id = state_->nextId++;
    state_->listeners.emplace(id, std::move(listener));
    return {state_, id};
}

ProgressPublisher::Snapshot ProgressPublisher::latest() const {
    std::scoped_lock lock(state_->mutex);
    return state_->latest;
}

size_t ProgressPublisher::subscriberCount() const {
    std::scoped_lock lock(state_->mutex);
    return state_->listeners.size();
}
