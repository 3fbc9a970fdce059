#include "cloud/ProviderRegistry.hpp"
#include "cloud/GoogleDrive.hpp"
#include "cloud/Dropbox.hpp"
#include "cloud/WebDAV.hpp"
#include "config/Config.hpp"

#include <stdexcept>

using namespace wb::cloud;

std::shared_ptr<ProviderRegistry> ProviderRegistry::withDefaults(const std::shared_ptr<http::Transport>& transport,
                                                                 const std::shared_ptr<CredentialStore>& credentials,
                                                                 const config::ProvidersConfig& cfg) {
    auto registry = std::make_shared<ProviderRegistry>();

    registry->registerProvider(GoogleDrive::ID, "Google Drive", [transport, credentials, c = cfg.google_drive] {
        return std::make_shared<GoogleDrive>(transport, credentials, c);
    });
    registry->registerProvider(Dropbox::ID, "Dropbox", [transport, credentials, c = cfg.dropbox] {
        return std::make_shared<Dropbox>(transport, credentials, c);
    });
    registry->registerProvider(WebDAV::ID, "WebDAV", [transport, credentials, c = cfg.webdav] {
        return std::make_shared<WebDAV>(transport, credentials, c);
    });

    return registry;
}

void ProviderRegistry::registerProvider(const std::string& id, const std::string& displayName, Factory factory) {
    if (id.empty() || id == NONE_ID) throw std::invalid_argument("Reserved or empty provider id: " + id);
    if (!factory) throw std::invalid_argument("Provider factory must not be empty: " + id);
    if (!entries_.contains(id)) order_.push_back(id);
    entries_[id] = Entry{displayName, std::move(factory)};
}

std::shared_ptr<Provider> ProviderRegistry::create(const std::string& id) const {
    const auto it = entries_.find(id);
    if (it == entries_.end()) return nullptr;
    return it->second.factory();
}

bool ProviderRegistry::contains(const std::string& id) const {
    return entries_.contains(id);
}

std::vector<std::pair<std::string, std::string>> ProviderRegistry::available() const {
    std::vector<std::pair<std::string, std::string>> out{{NONE_ID, NONE_NAME}};
    for (const auto& id : order_) out.emplace_back(id, entries_.at(id).displayName);
    return out;
}
