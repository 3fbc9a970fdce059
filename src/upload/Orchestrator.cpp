#include "upload/Orchestrator.hpp"
#include "upload/UploadScheduler.hpp"
#include "upload/ProgressPublisher.hpp"
#include "cloud/ProviderRegistry.hpp"
#include "storage/KeyValueStore.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace wb::upload;
using namespace wb::cloud;
using namespace wb::log;

Orchestrator::Orchestrator(std::shared_ptr<storage::KeyValueStore> settings,
                           std::shared_ptr<ProviderRegistry> providers,
                           std::shared_ptr<UploadScheduler> scheduler,
                           std::shared_ptr<ProgressPublisher> publisher)
    : settings_(std::move(settings)),
      providers_(std::move(providers)),
      scheduler_(std::move(scheduler)),
      publisher_(std::move(publisher)) {
    if (!settings_ || !providers_ || !scheduler_ || !publisher_)
        throw std::invalid_argument("Orchestrator requires settings, providers, a scheduler and a publisher");
}

std::string Orchestrator::selectedBackend() const {
    const auto value = settings_->get(SELECTED_BACKEND_KEY);
    if (!value || value->empty()) return ProviderRegistry::NONE_ID;
    return *value;
}

void Orchestrator::selectBackend(const std::string& id) {
    if (id != ProviderRegistry::NONE_ID && !providers_->contains(id))
        throw std::invalid_argument("Unknown storage backend: " + id);
    settings_->set(SELECTED_BACKEND_KEY, id);
    Registry::witness()->info("[Orchestrator] Selected backend: {}", id);
}

std::optional<std::string> Orchestrator::onFileProduced(const std::filesystem::path& path,
                                                        const std::optional<std::string>& name) {
    const auto backend = selectedBackend();
    if (backend == ProviderRegistry::NONE_ID) {
        Registry::witness()->debug("[Orchestrator] Cloud backup disabled, not uploading {}", path.string());
        return std::nullopt;
    }

    if (!providers_->contains(backend)) {
        Registry::witness()->error("[Orchestrator] Selected backend {} is not available, not uploading {}", backend, path.string());
        return std::nullopt;
    }

    try {
        const auto id = scheduler_->scheduleUpload(path, name.value_or(path.filename().string()), backend);
        publisher_->refresh();
        return id;
    } catch (const std::invalid_argument& e) {
        Registry::witness()->error("[Orchestrator] Cannot schedule {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

size_t Orchestrator::onStartup() {
    const auto backend = selectedBackend();
    if (backend != ProviderRegistry::NONE_ID) {
        if (const auto provider = providers_->create(backend)) {
            if (provider->isAuthenticated())
                Registry::witness()->info("[Orchestrator] Restored {} session", provider->displayName());
            else
                Registry::witness()->warn("[Orchestrator] {} is selected but not signed in", provider->displayName());
        } else {
            Registry::witness()->warn("[Orchestrator] Selected backend {} is not available", backend);
        }
    }

    const auto recovered = scheduler_->recoverPending();
    publisher_->refresh();
    return recovered;
}
