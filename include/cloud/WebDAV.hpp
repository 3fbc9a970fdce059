#pragma once

#include "cloud/ResumableProvider.hpp"
#include "config/Config.hpp"

namespace wb::cloud {

// Plain WebDAV PUT with Basic auth. Large files go up as Content-Range PUTs against
// the final URL, which doubles as the resume handle.
class WebDAV final : public ResumableProvider {
public:
    static constexpr const char* ID = "webdav";
    static constexpr unsigned int MAX_RENAME_ATTEMPTS = 100;

    WebDAV(std::shared_ptr<http::Transport> transport, std::shared_ptr<CredentialStore> credentials,
           config::WebDAVConfig cfg);

    [[nodiscard]] std::string displayName() const override { return "WebDAV"; }
    [[nodiscard]] std::string providerId() const override { return ID; }

    // PROPFIND (Depth: 0) against the stored base URI; records the result.
    bool authenticate() override;
    [[nodiscard]] bool isAuthenticated() const override;

    // Stores the server details, then validates them.
    bool configure(const std::string& baseUri, const std::string& username, const std::string& password);

    [[nodiscard]] std::string targetUrl(const std::string& fileName) const;

protected:
    [[nodiscard]] uint64_t resumableThreshold_() const override { return cfg_.chunk_size_bytes; }
    [[nodiscard]] uint64_t chunkSize_() const override { return cfg_.chunk_size_bytes; }

    bool uploadSimple_(const UploadRequest& req, const std::string& data, std::string& errorOut) override;

    std::optional<std::string> startSession_(const UploadRequest& req, uint64_t total, std::string& errorOut) override;

    ChunkResult sendChunk_(const UploadRequest& req, const std::string& handle, uint64_t offset,
                           const std::string& chunk, uint64_t total, std::string& errorOut) override;

private:
    config::WebDAVConfig cfg_;

    [[nodiscard]] std::string basicAuth_() const;

    // With auto_rename, the first of "name", "name (1).ext", ... that HEAD reports as free.
    std::string resolveTarget_(const std::string& fileName);
};

// "clip.mp4", 2 => "clip (2).mp4"
std::string numberedName(const std::string& fileName, unsigned int n);

}
