#pragma once

#include "cloud/ResumableProvider.hpp"
#include "config/Config.hpp"
#include "http/Transport.hpp"

namespace wb::cloud {

class Dropbox final : public ResumableProvider {
public:
    static constexpr const char* ID = "dropbox";

    Dropbox(std::shared_ptr<http::Transport> transport, std::shared_ptr<CredentialStore> credentials,
            config::DropboxConfig cfg);

    [[nodiscard]] std::string displayName() const override { return "Dropbox"; }
    [[nodiscard]] std::string providerId() const override { return ID; }

    // "/<folder>/<name>", or "/<name>" when no folder is configured.
    [[nodiscard]] std::string remotePath(const std::string& fileName) const;

protected:
    [[nodiscard]] uint64_t resumableThreshold_() const override { return cfg_.session_threshold_bytes; }
    [[nodiscard]] uint64_t chunkSize_() const override { return cfg_.chunk_size_bytes; }

    bool uploadSimple_(const UploadRequest& req, const std::string& data, std::string& errorOut) override;

    std::optional<std::string> startSession_(const UploadRequest& req, uint64_t total, std::string& errorOut) override;

    ChunkResult sendChunk_(const UploadRequest& req, const std::string& handle, uint64_t offset,
                           const std::string& chunk, uint64_t total, std::string& errorOut) override;

    bool finalize_(const UploadRequest& req, const std::string& handle, uint64_t total, std::string& errorOut) override;

private:
    config::DropboxConfig cfg_;

    [[nodiscard]] http::Request contentRequest_(const std::string& route, const std::string& apiArg) const;
};

}
