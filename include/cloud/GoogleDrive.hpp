#pragma once

#include "cloud/ResumableProvider.hpp"
#include "config/Config.hpp"
#include "http/Transport.hpp"

namespace wb::cloud {

class GoogleDrive final : public ResumableProvider {
public:
    static constexpr const char* ID = "google_drive";
    static constexpr uint64_t CHUNK_GRANULARITY = 256 * 1024;

    GoogleDrive(std::shared_ptr<http::Transport> transport, std::shared_ptr<CredentialStore> credentials,
                config::GoogleDriveConfig cfg);

    [[nodiscard]] std::string displayName() const override { return "Google Drive"; }
    [[nodiscard]] std::string providerId() const override { return ID; }

protected:
    [[nodiscard]] uint64_t resumableThreshold_() const override { return cfg_.resumable_threshold_bytes; }
    [[nodiscard]] uint64_t chunkSize_() const override;

    bool uploadSimple_(const UploadRequest& req, const std::string& data, std::string& errorOut) override;

    std::optional<std::string> startSession_(const UploadRequest& req, uint64_t total, std::string& errorOut) override;

    ResumePoint resumeOffset_(const std::string& handle, uint64_t startByte, uint64_t total, std::string& errorOut) override;

    ChunkResult sendChunk_(const UploadRequest& req, const std::string& handle, uint64_t offset,
                           const std::string& chunk, uint64_t total, std::string& errorOut) override;

    bool finalize_(const UploadRequest& req, const std::string& handle, uint64_t total, std::string& errorOut) override;

private:
    config::GoogleDriveConfig cfg_;

    [[nodiscard]] std::string metadata_(const UploadRequest& req) const;

    // PUT with "Content-Range: bytes */total"
    [[nodiscard]] http::Response queryStatus_(const std::string& handle, uint64_t total) const;
};

// "bytes=0-1234" => 1235. nullopt when the header is malformed.
std::optional<uint64_t> committedFromRange(const std::string& rangeHeader);

}
