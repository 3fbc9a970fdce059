#pragma once

#include "cloud/Provider.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace wb::http { class Transport; }
namespace wb::config { struct ProvidersConfig; }

namespace wb::cloud {

class CredentialStore;

class ProviderRegistry {
public:
    static constexpr const char* NONE_ID = "none";
    static constexpr const char* NONE_NAME = "None";

    using Factory = std::function<std::shared_ptr<Provider>()>;

    // Google Drive, Dropbox and WebDAV wired to the given transport and credentials.
    static std::shared_ptr<ProviderRegistry> withDefaults(const std::shared_ptr<http::Transport>& transport,
                                                          const std::shared_ptr<CredentialStore>& credentials,
                                                          const config::ProvidersConfig& cfg);

    void registerProvider(const std::string& id, const std::string& displayName, Factory factory);

    // A fresh provider per call; nullptr for unknown ids (including "none").
    [[nodiscard]] std::shared_ptr<Provider> create(const std::string& id) const;

    [[nodiscard]] bool contains(const std::string& id) const;

    // ("none", "None") first, then every registered backend as (id, display name).
    [[nodiscard]] std::vector<std::pair<std::string, std::string>> available() const;

private:
    struct Entry {
        std::string displayName;
        Factory factory;
    };

    std::map<std::string, Entry> entries_;
    std::vector<std::string> order_;
};

}
