#pragma once

#include <functional>
#include <optional>
#include <string>

namespace wb::storage {

// String-keyed persistence shared by every process on the host.
class KeyValueStore {
public:
    // Receives the current value (nullopt if absent) and returns the value to store.
    // Returning nullopt removes the key.
    using Mutator = std::function<std::optional<std::string>(const std::optional<std::string>&)>;

    virtual ~KeyValueStore() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;

    virtual void set(const std::string& key, const std::string& value) = 0;

    virtual void remove(const std::string& key) = 0;

    // Atomic read-modify-write: no other writer observes or interleaves with the mutation.
    virtual void update(const std::string& key, const Mutator& fn) = 0;
};

}
