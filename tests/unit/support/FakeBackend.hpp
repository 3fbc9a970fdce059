#pragma once

#include "http/Transport.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace wb::test {

// In-process stand-in for the Google Drive, Dropbox and WebDAV upload endpoints.
// Keeps committed offsets per session and can be told to fail chunk requests.
class FakeBackend final : public http::Transport {
public:
    static constexpr const char* DRIVE_ENDPOINT = "https://drive.fake.test";
    static constexpr const char* DROPBOX_ENDPOINT = "https://content.dropbox.fake.test/2";
    static constexpr const char* DAV_BASE = "https://dav.fake.test/files/alice";

    struct ChunkCall {
        std::string session;
        uint64_t offset = 0;
        uint64_t size = 0;
        long status = 0;
    };

    http::Response perform(const http::Request& req) override;

    // The chunk request after `okChunks` further successful ones answers `status`;
    // with `persistent`, every later chunk request does too.
    void failChunkAfter(size_t okChunks, long status = 503, bool persistent = false);
    void clearFaults();

    // Every request fails at the transport level (no HTTP status).
    void setOffline(bool offline);

    // Existing sessions answer as expired from now on.
    void expireSessions();

    void addExistingFile(const std::string& url);
    void setPropfindStatus(long status);

    [[nodiscard]] std::vector<ChunkCall> chunkCalls() const;
    [[nodiscard]] std::vector<ChunkCall> successfulChunks() const;
    [[nodiscard]] std::vector<http::Request> requests() const;  // bodies dropped
    [[nodiscard]] size_t sessionsStarted() const;
    [[nodiscard]] size_t requestCount(const std::string& method) const;

    // Completed uploads: remote name/path/url => size
    [[nodiscard]] std::map<std::string, uint64_t> completed() const;
    [[nodiscard]] std::optional<std::string> simpleBody(const std::string& name) const;

private:
    struct Session {
        uint64_t total = 0;
        uint64_t committed = 0;
        bool expired = false;
        bool done = false;
    };

    struct Fault {
        size_t remaining = 0;
        long status = 503;
        bool persistent = false;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Session> sessions_;
    std::map<std::string, uint64_t> completed_;
    std::map<std::string, std::string> simpleBodies_;
    std::set<std::string> existing_;
    std::vector<ChunkCall> chunkCalls_;
    std::vector<http::Request> requests_;
    std::optional<Fault> fault_;
    size_t sessionCounter_ = 0;
    long propfindStatus_ = 207;
    bool offline_ = false;

    // Consumes the fault budget; returns the status to fail with.
    std::optional<long> takeFault_();

    http::Response drive_(const http::Request& req);
    http::Response dropbox_(const http::Request& req);
    http::Response webdav_(const http::Request& req);
};

http::Response makeResponse(long status, std::string body = {}, const std::map<std::string, std::string>& headers = {});

}
