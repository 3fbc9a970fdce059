#pragma once

#include "cloud/Provider.hpp"
#include "cloud/CredentialStore.hpp"

#include <memory>

namespace wb::http { class Transport; }

namespace wb::cloud {

// Shared upload driver: simple transfer below the backend threshold, otherwise a
// session-based chunk loop that resumes from the persisted (or server-reported) offset.
class ResumableProvider : public Provider {
public:
    bool authenticate() override;
    [[nodiscard]] bool isAuthenticated() const override;
    void signOut() override;

    bool uploadFile(const UploadRequest& req, const ProgressFn& onProgress, std::string& errorOut) final;

protected:
    enum class ChunkOutcome { Continue, Complete, SessionLost, Failed };

    struct ChunkResult {
        ChunkOutcome outcome = ChunkOutcome::Failed;
        std::optional<uint64_t> committed;  // server-reported offset, when it differs from the chunk end
    };

    struct ResumePoint {
        enum class State { Resume, Complete, SessionLost, Failed } state = State::Resume;
        uint64_t offset = 0;
    };

    ResumableProvider(std::shared_ptr<http::Transport> transport, std::shared_ptr<CredentialStore> credentials);

    [[nodiscard]] virtual uint64_t resumableThreshold_() const = 0;
    [[nodiscard]] virtual uint64_t chunkSize_() const = 0;

    virtual bool uploadSimple_(const UploadRequest& req, const std::string& data, std::string& errorOut) = 0;

    // New session handle, or nullopt with errorOut set.
    virtual std::optional<std::string> startSession_(const UploadRequest& req, uint64_t total, std::string& errorOut) = 0;

    // Where to continue an existing session. Defaults to the persisted start byte.
    virtual ResumePoint resumeOffset_(const std::string& handle, uint64_t startByte, uint64_t total, std::string& errorOut);

    virtual ChunkResult sendChunk_(const UploadRequest& req, const std::string& handle, uint64_t offset,
                                   const std::string& chunk, uint64_t total, std::string& errorOut) = 0;

    virtual bool finalize_(const UploadRequest& req, const std::string& handle, uint64_t total, std::string& errorOut);

    [[nodiscard]] Credentials credentials() const;
    [[nodiscard]] std::string bearer_() const;

    std::shared_ptr<http::Transport> transport_;
    std::shared_ptr<CredentialStore> credentialStore_;

private:
    bool uploadChunked_(const UploadRequest& req, uint64_t total, const ProgressFn& onProgress, std::string& errorOut);
};

}
