#pragma once

#include <memory>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace wb::storage { class KeyValueStore; }

namespace wb::cloud {

struct Credentials {
    std::string access_token, refresh_token;
    std::string base_uri, username, password;
    bool is_authenticated = false;
};

void to_json(nlohmann::json& j, const Credentials& c);
void from_json(const nlohmann::json& j, Credentials& c);

class CredentialStore {
public:
    explicit CredentialStore(std::shared_ptr<storage::KeyValueStore> kv);

    [[nodiscard]] static std::string keyFor(const std::string& providerId);

    // Empty credentials when nothing (or nothing readable) is stored.
    [[nodiscard]] Credentials load(const std::string& providerId) const;

    void save(const std::string& providerId, const Credentials& creds);

    // Forgets every secret and records is_authenticated = false.
    void clear(const std::string& providerId);

private:
    std::shared_ptr<storage::KeyValueStore> kv_;
};

}
