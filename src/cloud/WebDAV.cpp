#include "cloud/WebDAV.hpp"
#include "http/Transport.hpp"
#include "util/encoding.hpp"
#include "util/mime.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

using namespace wb::cloud;
using namespace wb::http;
using namespace wb::util;
using namespace wb::log;

std::string wb::cloud::numberedName(const std::string& fileName, const unsigned int n) {
    const auto dot = fileName.rfind('.');
    if (dot == std::string::npos || dot == 0) return fmt::format("{} ({})", fileName, n);
    return fmt::format("{} ({}){}", fileName.substr(0, dot), n, fileName.substr(dot));
}

WebDAV::WebDAV(std::shared_ptr<Transport> transport, std::shared_ptr<CredentialStore> credentials,
               config::WebDAVConfig cfg)
    : ResumableProvider(std::move(transport), std::move(credentials)), cfg_(std::move(cfg)) {}

bool WebDAV::isAuthenticated() const {
    const auto c = credentials();
    return c.is_authenticated && !c.base_uri.empty();
}

std::string WebDAV::basicAuth_() const {
    const auto c = credentials();
    return "Basic " + base64Encode(c.username + ":" + c.password);
}

std::string WebDAV::targetUrl(const std::string& fileName) const {
    auto base = credentials().base_uri;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/" + urlEncode(fileName);
}

bool WebDAV::configure(const std::string& baseUri, const std::string& username, const std::string& password) {
    Credentials c;
    c.base_uri = baseUri;
    c.username = username;
    c.password = password;
    credentialStore_->save(ID, c);
    return authenticate();
}

bool WebDAV::authenticate() {
    auto c = credentials();
    if (c.base_uri.empty()) {
        Registry::cloud()->warn("[WebDAV] No server configured");
        return false;
    }

    Request r;
    r.method = "PROPFIND";
    r.url = c.base_uri;
    r.header("Authorization", basicAuth_()).header("Depth", "0");

    const auto resp = transport_->perform(r);
    c.is_authenticated = resp.http == 207 || resp.http == 200;
    credentialStore_->save(ID, c);

    if (c.is_authenticated) Registry::cloud()->info("[WebDAV] Connected to {}", c.base_uri);
    else Registry::cloud()->warn("[WebDAV] Connection check against {} failed: {}", c.base_uri, resp.describe());
    return c.is_authenticated;
}

std::string WebDAV::resolveTarget_(const std::string& fileName) {
    const auto plain = targetUrl(fileName);
    if (!cfg_.auto_rename) return plain;

    const auto isFree = [&](const std::string& url) {
        Request r;
        r.method = "HEAD";
        r.url = url;
        r.header("Authorization", basicAuth_());
        const auto resp = transport_->perform(r);
        // anything but an explicit hit is treated as free; PUT will surface real errors
        return resp.http != 200 && resp.http != 204;
    };

    if (isFree(plain)) return plain;
    for (unsigned int n = 1; n <= MAX_RENAME_ATTEMPTS; ++n) {
        const auto candidate = targetUrl(numberedName(fileName, n));
        if (isFree(candidate)) {
            Registry::cloud()->info("[WebDAV] {} exists, uploading as {}", fileName, numberedName(fileName, n));
            return candidate;
        }
    }

    Registry::cloud()->warn("[WebDAV] No free name for {} after {} attempts, overwriting", fileName, MAX_RENAME_ATTEMPTS);
    return plain;
}

bool WebDAV::uploadSimple_(const UploadRequest& req, const std::string& data, std::string& errorOut) {
    Request r;
    r.method = "PUT";
    r.url = resolveTarget_(req.fileName);
    r.header("Authorization", basicAuth_()).header("Content-Type", mimeTypeFor(req.fileName));
    r.body = data;

    const auto resp = transport_->perform(r);
    if (resp.http == 200 || resp.http == 201 || resp.http == 204) return true;

    errorOut = "WebDAV upload failed: " + resp.describe();
    Registry::cloud()->error("[WebDAV] {}", errorOut);
    return false;
}

std::optional<std::string> WebDAV::startSession_(const UploadRequest& req, uint64_t, std::string& errorOut) {
    if (credentials().base_uri.empty()) {
        errorOut = "WebDAV server is not configured";
        return std::nullopt;
    }
    return resolveTarget_(req.fileName);
}

WebDAV::ChunkResult WebDAV::sendChunk_(const UploadRequest& req, const std::string& handle, const uint64_t offset,
                                       const std::string& chunk, const uint64_t total, std::string& errorOut) {
    Request r;
    r.method = "PUT";
    r.url = handle;
    r.header("Authorization", basicAuth_())
     .header("Content-Type", mimeTypeFor(req.fileName))
     .header("Content-Range", fmt::format("bytes {}-{}/{}", offset, offset + chunk.size() - 1, total));
    r.body = chunk;

    const auto resp = transport_->perform(r);
    if (resp.http == 200 || resp.http == 201 || resp.http == 204 || resp.http == 308)
        return {ChunkOutcome::Continue, std::nullopt};

    errorOut = fmt::format("WebDAV rejected range at {}: {}", offset, resp.describe());
    Registry::cloud()->warn("[WebDAV] {}", errorOut);
    return {ChunkOutcome::Failed, std::nullopt};
}
