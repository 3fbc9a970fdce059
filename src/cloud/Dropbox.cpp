#include "cloud/Dropbox.hpp"
#include "http/Transport.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace wb::cloud;
using namespace wb::http;
using namespace wb::log;
using json = nlohmann::json;

namespace {

// Dropbox-API-Arg travels in a header, so non-ASCII must be \u-escaped
std::string headerJson(const json& j) { return j.dump(-1, ' ', true); }

std::string errorTag(const std::string& body) {
    const auto j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return {};
    if (const auto summary = j.find("error_summary"); summary != j.end() && summary->is_string())
        return summary->get<std::string>();
    return {};
}

std::optional<uint64_t> correctOffset(const std::string& body) {
    const auto j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    const auto err = j.find("error");
    if (err == j.end() || !err->is_object()) return std::nullopt;
    const auto tag = err->find(".tag");
    if (tag == err->end() || !tag->is_string() || tag->get<std::string>() != "incorrect_offset") return std::nullopt;
    const auto correct = err->find("correct_offset");
    if (correct == err->end() || !correct->is_number_unsigned()) return std::nullopt;
    return correct->get<uint64_t>();
}

bool isSessionGone(const Response& resp) {
    if (resp.http == 404) return true;
    if (resp.http != 409) return false;
    const auto tag = errorTag(resp.body);
    return tag.find("not_found") != std::string::npos || tag.find("closed") != std::string::npos;
}

}

Dropbox::Dropbox(std::shared_ptr<Transport> transport, std::shared_ptr<CredentialStore> credentials,
                 config::DropboxConfig cfg)
    : ResumableProvider(std::move(transport), std::move(credentials)), cfg_(std::move(cfg)) {}

std::string Dropbox::remotePath(const std::string& fileName) const {
    auto folder = cfg_.folder;
    while (!folder.empty() && folder.front() == '/') folder.erase(folder.begin());
    while (!folder.empty() && folder.back() == '/') folder.pop_back();
    if (folder.empty()) return "/" + fileName;
    return "/" + folder + "/" + fileName;
}

Request Dropbox::contentRequest_(const std::string& route, const std::string& apiArg) const {
    Request r;
    r.method = "POST";
    r.url = cfg_.content_endpoint + "/" + route;
    r.header("Authorization", bearer_())
     .header("Content-Type", "application/octet-stream")
     .header("Dropbox-API-Arg", apiArg);
    return r;
}

bool Dropbox::uploadSimple_(const UploadRequest& req, const std::string& data, std::string& errorOut) {
    const json arg = {
        {"path", remotePath(req.fileName)},
        {"mode", cfg_.commit.mode},
        {"autorename", cfg_.commit.autorename},
        {"mute", cfg_.commit.mute}
    };

    auto r = contentRequest_("files/upload", headerJson(arg));
    r.body = data;

    const auto resp = transport_->perform(r);
    if (resp.http == 200) return true;

    errorOut = "Dropbox upload failed: " + resp.describe();
    Registry::cloud()->error("[Dropbox] {}", errorOut);
    return false;
}

std::optional<std::string> Dropbox::startSession_(const UploadRequest& req, const uint64_t total, std::string& errorOut) {
    const auto resp = transport_->perform(contentRequest_("files/upload_session/start", headerJson({{"close", false}})));

    if (resp.http == 200) {
        const auto j = json::parse(resp.body, nullptr, false);
        if (!j.is_discarded() && j.contains("session_id") && j["session_id"].is_string()) {
            Registry::cloud()->info("[Dropbox] Started upload session for {} ({} bytes)", req.fileName, total);
            return j["session_id"].get<std::string>();
        }
        errorOut = "Dropbox did not return a session id";
    } else {
        errorOut = "Failed to start Dropbox upload session: " + resp.describe();
    }

    Registry::cloud()->error("[Dropbox] {}", errorOut);
    return std::nullopt;
}

Dropbox::ChunkResult Dropbox::sendChunk_(const UploadRequest&, const std::string& handle, const uint64_t offset,
                                         const std::string& chunk, uint64_t, std::string& errorOut) {
    const json arg = {{"cursor", {{"session_id", handle}, {"offset", offset}}}, {"close", false}};

    auto r = contentRequest_("files/upload_session/append_v2", headerJson(arg));
    r.body = chunk;

    const auto resp = transport_->perform(r);
    if (resp.http == 200) return {ChunkOutcome::Continue, std::nullopt};
    if (isSessionGone(resp)) return {ChunkOutcome::SessionLost, std::nullopt};

    // the server already holds bytes we think are missing (or vice versa); realign
    if (resp.http == 409) {
        if (const auto correct = correctOffset(resp.body); correct && *correct > offset) {
            Registry::cloud()->warn("[Dropbox] Offset {} rejected, server expects {}", offset, *correct);
            return {ChunkOutcome::Continue, correct};
        }
    }

    errorOut = fmt::format("Dropbox rejected chunk at {}: {}", offset, resp.describe());
    Registry::cloud()->warn("[Dropbox] {}", errorOut);
    return {ChunkOutcome::Failed, std::nullopt};
}

bool Dropbox::finalize_(const UploadRequest& req, const std::string& handle, const uint64_t total, std::string& errorOut) {
    const json arg = {
        {"cursor", {{"session_id", handle}, {"offset", total}}},
        {"commit", {
            {"path", remotePath(req.fileName)},
            {"mode", cfg_.commit.mode},
            {"autorename", cfg_.commit.autorename},
            {"mute", cfg_.commit.mute}
        }}
    };

    const auto resp = transport_->perform(contentRequest_("files/upload_session/finish", headerJson(arg)));
    if (resp.http == 200) {
        Registry::cloud()->info("[Dropbox] Committed {} to {}", req.fileName, remotePath(req.fileName));
        return true;
    }

    errorOut = "Dropbox finish failed: " + resp.describe();
    Registry::cloud()->error("[Dropbox] {}", errorOut);
    return false;
}
