#include "storage/MemoryKeyValueStore.hpp"

using namespace wb::storage;

std::optional<std::string> MemoryKeyValueStore::get(const std::string& key) {
    std::scoped_lock lock(mutex_);
    if (const auto it = values_.find(key); it != values_.end()) return it->second;
    return std::nullopt;
}

void MemoryKeyValueStore::set(const std::string& key, const std::string& value) {
    std::scoped_lock lock(mutex_);
    values_[key] = value;
}

void MemoryKeyValueStore::remove(const std::string& key) {
    std::scoped_lock lock(mutex_);
    values_.erase(key);
}

void MemoryKeyValueStore::update(const std::string& key, const Mutator& fn) {
    std::scoped_lock lock(mutex_);
    std::optional<std::string> current;
    if (const auto it = values_.find(key); it != values_.end()) current = it->second;
    if (const auto next = fn(current)) values_[key] = *next;
    else values_.erase(key);
}
