#include "cloud/CredentialStore.hpp"
#include "storage/KeyValueStore.hpp"
#include "log/Registry.hpp"

#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace wb::cloud;
using namespace wb::log;

void wb::cloud::to_json(nlohmann::json& j, const Credentials& c) {
    j = nlohmann::json{
        {"access_token", c.access_token},
        {"refresh_token", c.refresh_token},
        {"base_uri", c.base_uri},
        {"username", c.username},
        {"password", c.password},
        {"is_authenticated", c.is_authenticated}
    };
}

void wb::cloud::from_json(const nlohmann::json& j, Credentials& c) {
    c.access_token = j.value("access_token", std::string());
    c.refresh_token = j.value("refresh_token", std::string());
    c.base_uri = j.value("base_uri", std::string());
    c.username = j.value("username", std::string());
    c.password = j.value("password", std::string());
    c.is_authenticated = j.value("is_authenticated", false);
}

CredentialStore::CredentialStore(std::shared_ptr<storage::KeyValueStore> kv) : kv_(std::move(kv)) {
    if (!kv_) throw std::invalid_argument("CredentialStore requires a key-value store");
}

std::string CredentialStore::keyFor(const std::string& providerId) {
    return "credentials_" + providerId;
}

Credentials CredentialStore::load(const std::string& providerId) const {
    const auto raw = kv_->get(keyFor(providerId));
    if (!raw) return {};
    try {
        return nlohmann::json::parse(*raw).get<Credentials>();
    } catch (const std::exception& e) {
        Registry::store()->error("[CredentialStore] Unreadable credentials for {}: {}", providerId, e.what());
        return {};
    }
}

void CredentialStore::save(const std::string& providerId, const Credentials& creds) {
    kv_->set(keyFor(providerId), nlohmann::json(creds).dump());
}

void CredentialStore::clear(const std::string& providerId) {
    save(providerId, Credentials{});
}
