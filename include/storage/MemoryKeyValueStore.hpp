#pragma once

#include "storage/KeyValueStore.hpp"

#include <mutex>
#include <unordered_map>

namespace wb::storage {

class MemoryKeyValueStore final : public KeyValueStore {
public:
    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value) override;
    void remove(const std::string& key) override;
    void update(const std::string& key, const Mutator& fn) override;

private:
    std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

}
