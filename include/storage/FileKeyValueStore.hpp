#pragma once

#include "storage/KeyValueStore.hpp"

#include <filesystem>

namespace wb::storage {

// One file per key (<dir>/<key>.json). Writers serialize on an exclusive flock of
// <dir>/<key>.lock and publish by rename(2), so readers never see a torn value.
class FileKeyValueStore final : public KeyValueStore {
public:
    explicit FileKeyValueStore(std::filesystem::path dir);

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value) override;
    void remove(const std::string& key) override;
    void update(const std::string& key, const Mutator& fn) override;

    [[nodiscard]] const std::filesystem::path& directory() const { return dir_; }

private:
    std::filesystem::path dir_;

    [[nodiscard]] std::filesystem::path valuePath_(const std::string& key) const;
    [[nodiscard]] std::filesystem::path lockPath_(const std::string& key) const;

    std::optional<std::string> read_(const std::string& key) const;
    void write_(const std::string& key, const std::string& value) const;
    void erase_(const std::string& key) const;
};

}
