#include "cloud/ResumableProvider.hpp"
#include "http/Transport.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <fmt/format.h>

using namespace wb::cloud;
using namespace wb::log;
namespace fs = std::filesystem;

namespace {

bool readRange(std::ifstream& in, const uint64_t offset, const uint64_t len, std::string& out) {
    out.resize(len);
    in.clear();
    in.seekg(static_cast<std::streamoff>(offset));
    if (!in) return false;
    in.read(out.data(), static_cast<std::streamsize>(len));
    return static_cast<uint64_t>(in.gcount()) == len;
}

}

ResumableProvider::ResumableProvider(std::shared_ptr<http::Transport> transport,
                                     std::shared_ptr<CredentialStore> credentials)
    : transport_(std::move(transport)), credentialStore_(std::move(credentials)) {
    if (!transport_) throw std::invalid_argument("Provider requires an HTTP transport");
    if (!credentialStore_) throw std::invalid_argument("Provider requires a credential store");
}

Credentials ResumableProvider::credentials() const {
    return credentialStore_->load(providerId());
}

std::string ResumableProvider::bearer_() const {
    return "Bearer " + credentials().access_token;
}

bool ResumableProvider::authenticate() {
    // tokens are deposited by the external consent flow; nothing to negotiate here
    const bool ok = isAuthenticated();
    if (!ok) Registry::cloud()->warn("[{}] No stored credentials; complete sign-in first", displayName());
    return ok;
}

bool ResumableProvider::isAuthenticated() const {
    const auto c = credentials();
    return c.is_authenticated && !c.access_token.empty();
}

void ResumableProvider::signOut() {
    credentialStore_->clear(providerId());
    Registry::cloud()->info("[{}] Signed out", displayName());
}

ResumableProvider::ResumePoint ResumableProvider::resumeOffset_(const std::string&, const uint64_t startByte,
                                                                const uint64_t total, std::string&) {
    return {ResumePoint::State::Resume, std::min(startByte, total)};
}

bool ResumableProvider::finalize_(const UploadRequest&, const std::string&, uint64_t, std::string&) {
    return true;
}

bool ResumableProvider::uploadFile(const UploadRequest& req, const ProgressFn& onProgress, std::string& errorOut) {
    errorOut.clear();

    std::error_code ec;
    if (!fs::is_regular_file(req.filePath, ec)) {
        errorOut = "File not found: " + req.filePath.string();
        return false;
    }

    const auto total = static_cast<uint64_t>(fs::file_size(req.filePath, ec));
    if (ec) {
        errorOut = fmt::format("Cannot stat {}: {}", req.filePath.string(), ec.message());
        return false;
    }
    if (total == 0) {
        errorOut = "File is empty: " + req.filePath.string();
        return false;
    }

    if (total > resumableThreshold_()) return uploadChunked_(req, total, onProgress, errorOut);

    std::ifstream in(req.filePath, std::ios::binary);
    std::string data;
    if (!in || !readRange(in, 0, total, data)) {
        errorOut = "Failed to read " + req.filePath.string();
        return false;
    }

    Registry::cloud()->debug("[{}] Simple upload of {} ({} bytes)", displayName(), req.fileName, total);
    if (!uploadSimple_(req, data, errorOut)) return false;

    onProgress(total, total, std::nullopt);
    return true;
}

bool ResumableProvider::uploadChunked_(const UploadRequest& req, const uint64_t total, const ProgressFn& onProgress,
                                       std::string& errorOut) {
    std::ifstream in(req.filePath, std::ios::binary);
    if (!in) {
        errorOut = "Failed to open " + req.filePath.string();
        return false;
    }

    bool restarted = false;
    std::string handle;
    uint64_t offset = 0;

    const auto freshSession = [&]() {
        const auto started = startSession_(req, total, errorOut);
        if (!started) return false;
        handle = *started;
        offset = 0;
        onProgress(0, total, handle);
        return true;
    };

    if (req.resumeToken && !req.resumeToken->empty()) {
        handle = *req.resumeToken;
        const auto rp = resumeOffset_(handle, req.startByte.value_or(0), total, errorOut);
        switch (rp.state) {
            case ResumePoint::State::Complete:
                Registry::cloud()->info("[{}] {} already committed remotely", displayName(), req.fileName);
                onProgress(total, total, handle);
                return true;
            case ResumePoint::State::SessionLost:
                Registry::cloud()->warn("[{}] Session for {} expired, starting over", displayName(), req.fileName);
                restarted = true;
                if (!freshSession()) return false;
                break;
            case ResumePoint::State::Failed:
                return false;
            case ResumePoint::State::Resume:
                offset = rp.offset;
                Registry::cloud()->info("[{}] Resuming {} at byte {} of {}", displayName(), req.fileName, offset, total);
                break;
        }
    } else if (!freshSession()) {
        return false;
    }

    const uint64_t chunkSize = std::max<uint64_t>(chunkSize_(), 1);
    std::string chunk;
    bool complete = false;

    while (offset < total && !complete) {
        const uint64_t len = std::min(chunkSize, total - offset);
        if (!readRange(in, offset, len, chunk)) {
            errorOut = fmt::format("Failed to read {} at offset {}", req.filePath.string(), offset);
            return false;
        }

        const auto result = sendChunk_(req, handle, offset, chunk, total, errorOut);
        switch (result.outcome) {
            case ChunkOutcome::Continue:
                if (result.committed && *result.committed <= offset) {
                    errorOut = fmt::format("Backend made no progress past byte {}", offset);
                    return false;
                }
                offset = std::min(result.committed.value_or(offset + len), total);
                onProgress(offset, total, handle);
                break;
            case ChunkOutcome::Complete:
                offset = total;
                complete = true;
                onProgress(total, total, handle);
                break;
            case ChunkOutcome::SessionLost:
                if (restarted) {
                    if (errorOut.empty()) errorOut = "Upload session lost twice";
                    return false;
                }
                Registry::cloud()->warn("[{}] Session for {} lost at byte {}, starting over", displayName(), req.fileName, offset);
                restarted = true;
                errorOut.clear();
                if (!freshSession()) return false;
                break;
            case ChunkOutcome::Failed:
                if (errorOut.empty()) errorOut = fmt::format("Chunk at offset {} rejected", offset);
                return false;
        }
    }

    return complete || finalize_(req, handle, total, errorOut);
}
