#include "cloud/GoogleDrive.hpp"
#include "http/Transport.hpp"
#include "util/mime.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <charconv>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace wb::cloud;
using namespace wb::http;
using namespace wb::util;
using namespace wb::log;

namespace {

constexpr const char* BOUNDARY = "witnessbackup_part_boundary";

bool isSessionGone(const Response& resp) { return resp.http == 404 || resp.http == 410; }

}

std::optional<uint64_t> wb::cloud::committedFromRange(const std::string& rangeHeader) {
    const auto dash = rangeHeader.rfind('-');
    if (dash == std::string::npos || dash + 1 >= rangeHeader.size()) return std::nullopt;
    uint64_t last = 0;
    const auto* begin = rangeHeader.data() + dash + 1;
    const auto* end = rangeHeader.data() + rangeHeader.size();
    if (const auto [ptr, ec] = std::from_chars(begin, end, last); ec != std::errc() || ptr != end) return std::nullopt;
    return last + 1;
}

GoogleDrive::GoogleDrive(std::shared_ptr<Transport> transport, std::shared_ptr<CredentialStore> credentials,
                         config::GoogleDriveConfig cfg)
    : ResumableProvider(std::move(transport), std::move(credentials)), cfg_(std::move(cfg)) {}

uint64_t GoogleDrive::chunkSize_() const {
    // Drive rejects intermediate chunks that are not a multiple of 256 KiB
    const auto rounded = cfg_.chunk_size_bytes / CHUNK_GRANULARITY * CHUNK_GRANULARITY;
    return std::max(rounded, CHUNK_GRANULARITY);
}

std::string GoogleDrive::metadata_(const UploadRequest& req) const {
    nlohmann::json meta = {{"name", req.fileName}, {"mimeType", mimeTypeFor(req.fileName)}};
    if (!cfg_.folder_id.empty()) meta["parents"] = nlohmann::json::array({cfg_.folder_id});
    return meta.dump();
}

bool GoogleDrive::uploadSimple_(const UploadRequest& req, const std::string& data, std::string& errorOut) {
    std::string body;
    body.reserve(data.size() + 512);
    body += fmt::format("--{}\r\nContent-Type: application/json; charset=UTF-8\r\n\r\n{}\r\n", BOUNDARY, metadata_(req));
    body += fmt::format("--{}\r\nContent-Type: {}\r\n\r\n", BOUNDARY, mimeTypeFor(req.fileName));
    body += data;
    body += fmt::format("\r\n--{}--\r\n", BOUNDARY);

    Request r;
    r.method = "POST";
    r.url = cfg_.upload_endpoint + "/upload/drive/v3/files?uploadType=multipart";
    r.header("Authorization", bearer_())
     .header("Content-Type", fmt::format("multipart/related; boundary={}", BOUNDARY));
    r.body = std::move(body);

    const auto resp = transport_->perform(r);
    if (resp.http == 200 || resp.http == 201) return true;

    errorOut = "Google Drive upload failed: " + resp.describe();
    Registry::cloud()->error("[GoogleDrive] {}", errorOut);
    return false;
}

std::optional<std::string> GoogleDrive::startSession_(const UploadRequest& req, const uint64_t total,
                                                      std::string& errorOut) {
    Request r;
    r.method = "POST";
    r.url = cfg_.upload_endpoint + "/upload/drive/v3/files?uploadType=resumable";
    r.header("Authorization", bearer_())
     .header("Content-Type", "application/json; charset=UTF-8")
     .header("X-Upload-Content-Type", mimeTypeFor(req.fileName))
     .header("X-Upload-Content-Length", std::to_string(total));
    r.body = metadata_(req);

    const auto resp = transport_->perform(r);
    if (resp.http == 200 || resp.http == 201) {
        if (auto location = resp.header("Location"); location && !location->empty()) {
            Registry::cloud()->info("[GoogleDrive] Started resumable session for {} ({} bytes)", req.fileName, total);
            return location;
        }
        errorOut = "Google Drive did not return a session URI";
    } else {
        errorOut = "Failed to start Google Drive session: " + resp.describe();
    }

    Registry::cloud()->error("[GoogleDrive] {}", errorOut);
    return std::nullopt;
}

Response GoogleDrive::queryStatus_(const std::string& handle, const uint64_t total) const {
    Request r;
    r.method = "PUT";
    r.url = handle;
    r.header("Authorization", bearer_())
     .header("Content-Range", fmt::format("bytes */{}", total));
    return transport_->perform(r);
}

GoogleDrive::ResumePoint GoogleDrive::resumeOffset_(const std::string& handle, uint64_t, const uint64_t total,
                                                    std::string& errorOut) {
    const auto resp = queryStatus_(handle, total);

    if (resp.http == 308) {
        const auto range = resp.header("Range");
        if (!range) return {ResumePoint::State::Resume, 0};
        if (const auto committed = committedFromRange(*range)) return {ResumePoint::State::Resume, std::min(*committed, total)};
        errorOut = "Malformed Range header from Google Drive: " + *range;
        return {ResumePoint::State::Failed, 0};
    }
    if (resp.http == 200 || resp.http == 201) return {ResumePoint::State::Complete, total};
    if (isSessionGone(resp)) return {ResumePoint::State::SessionLost, 0};

    errorOut = "Google Drive status query failed: " + resp.describe();
    Registry::cloud()->warn("[GoogleDrive] {}", errorOut);
    return {ResumePoint::State::Failed, 0};
}

GoogleDrive::ChunkResult GoogleDrive::sendChunk_(const UploadRequest&, const std::string& handle, const uint64_t offset,
                                                 const std::string& chunk, const uint64_t total, std::string& errorOut) {
    Request r;
    r.method = "PUT";
    r.url = handle;
    r.header("Authorization", bearer_())
     .header("Content-Range", fmt::format("bytes {}-{}/{}", offset, offset + chunk.size() - 1, total));
    r.body = chunk;

    const auto resp = transport_->perform(r);

    if (resp.http == 308) {
        // No Range header means Drive has persisted nothing yet
        const auto range = resp.header("Range");
        return {ChunkOutcome::Continue, range ? committedFromRange(*range).value_or(0) : 0};
    }
    if (resp.http == 200 || resp.http == 201) return {ChunkOutcome::Complete, total};
    if (isSessionGone(resp)) return {ChunkOutcome::SessionLost, std::nullopt};

    errorOut = fmt::format("Google Drive rejected chunk at {}: {}", offset, resp.describe());
    Registry::cloud()->warn("[GoogleDrive] {}", errorOut);
    return {ChunkOutcome::Failed, std::nullopt};
}

bool GoogleDrive::finalize_(const UploadRequest& req, const std::string& handle, const uint64_t total,
                            std::string& errorOut) {
    // Every byte was acknowledged with 308; only a 200/201 proves the file exists
    const auto resp = queryStatus_(handle, total);
    if (resp.http == 200 || resp.http == 201) return true;

    errorOut = fmt::format("Google Drive never confirmed {}: {}", req.fileName, resp.describe());
    Registry::cloud()->error("[GoogleDrive] {}", errorOut);
    return false;
}
