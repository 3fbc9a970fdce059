#include <gtest/gtest.h>
#include <algorithm>
#include <map>
#include "cloud/GoogleDrive.hpp"
#include "storage/MemoryKeyValueStore.hpp"
#include "support/FakeBackend.hpp"
#include "support/TestFiles.hpp"

using namespace wb::cloud;
using namespace wb::test;
using wb::config::MiB;

class GoogleDriveTest : public ::testing::Test {
protected:
    struct Event {
        uint64_t uploaded, total;
        std::optional<std::string> token;
    };

    TempDir dir;
    std::shared_ptr<FakeBackend> backend = std::make_shared<FakeBackend>();
    std::shared_ptr<CredentialStore> creds = std::make_shared<CredentialStore>(std::make_shared<wb::storage::MemoryKeyValueStore>());
    wb::config::GoogleDriveConfig cfg;
    std::vector<Event> events;

    void SetUp() override {
        cfg.upload_endpoint = FakeBackend::DRIVE_ENDPOINT;
        Credentials c;
        c.access_token = "ya29.token";
        c.is_authenticated = true;
        creds->save(GoogleDrive::ID, c);
    }

    std::unique_ptr<GoogleDrive> drive() const { return std::make_unique<GoogleDrive>(backend, creds, cfg); }

    ProgressFn recorder() {
        return [this](const uint64_t u, const uint64_t t, const std::optional<std::string>& tok) { events.push_back({u, t, tok}); };
    }

    bool upload(const std::filesystem::path& file, std::string& error,
                const std::optional<std::string>& token = std::nullopt, const std::optional<uint64_t>& start = std::nullopt) {
        return drive()->uploadFile({file, file.filename().string(), token, start}, recorder(), error);
    }
};

TEST_F(GoogleDriveTest, SmallFileUsesMultipartUpload) {
    const auto file = writePatternFile(dir / "clip.mp4", 1000);
    std::string error;

    ASSERT_TRUE(upload(file, error)) << error;

    EXPECT_EQ(backend->simpleBody("clip.mp4"), readFile(file));
    const auto reqs = backend->requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_NE(reqs[0].url.find("uploadType=multipart"), std::string::npos);
    EXPECT_TRUE(std::ranges::any_of(reqs[0].headers, [](const auto& h) {
        return h.first == "Authorization" && h.second == "Bearer ya29.token";
    }));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].uploaded, 1000u);
    EXPECT_FALSE(events[0].token);
}

TEST_F(GoogleDriveTest, LargeFileGoesThroughResumableSession) {
    cfg.resumable_threshold_bytes = 1 * MiB;
    cfg.chunk_size_bytes = 1 * MiB;
    const uint64_t total = 3 * MiB + MiB / 2;
    const auto file = writePatternFile(dir / "clip.mp4", total);
    std::string error;

    ASSERT_TRUE(upload(file, error)) << error;

    const auto chunks = backend->successfulChunks();
    ASSERT_EQ(chunks.size(), 4u);
    EXPECT_EQ(chunks[0].offset, 0u);
    EXPECT_EQ(chunks[3].offset, 3 * MiB);
    EXPECT_EQ(chunks[3].size, MiB / 2);

    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.front().uploaded, 0u);
    ASSERT_TRUE(events.front().token);
    EXPECT_EQ(backend->completed().at(*events.front().token), total);
    EXPECT_EQ(events.back().uploaded, total);
    for (size_t i = 1; i < events.size(); ++i) EXPECT_GE(events[i].uploaded, events[i - 1].uploaded);
}

TEST_F(GoogleDriveTest, ChunkSizeIsRoundedToQuarterMebibyte) {
    cfg.resumable_threshold_bytes = 100 * 1024;
    cfg.chunk_size_bytes = 300 * 1024;
    const auto file = writePatternFile(dir / "clip.mp4", 600 * 1024);
    std::string error;

    ASSERT_TRUE(upload(file, error)) << error;

    const auto chunks = backend->successfulChunks();
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].size, GoogleDrive::CHUNK_GRANULARITY);
    EXPECT_EQ(chunks[1].size, GoogleDrive::CHUNK_GRANULARITY);
    EXPECT_EQ(chunks[2].size, 600 * 1024 - 2 * GoogleDrive::CHUNK_GRANULARITY);
}

TEST_F(GoogleDriveTest, ResumesFromOffsetReportedByServer) {
    const uint64_t total = 200 * MiB;
    const auto file = writeSparseFile(dir / "long_recording.mp4", total);
    std::string error;

    backend->failChunkAfter(3);
    ASSERT_FALSE(upload(file, error));
    EXPECT_FALSE(error.empty());
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().uploaded, 25165824u);
    const auto session = events.back().token;
    ASSERT_TRUE(session);

    const auto before = backend->chunkCalls().size();

    // a stale start byte must not matter: the server's committed range wins
    ASSERT_TRUE(upload(file, error, session, 0)) << error;

    const auto calls = backend->chunkCalls();
    const std::vector resumed(calls.begin() + static_cast<long>(before), calls.end());
    ASSERT_EQ(resumed.size(), 22u);
    EXPECT_EQ(resumed.front().offset, 25165824u);
    EXPECT_EQ(resumed.back().offset + resumed.back().size, total);
    EXPECT_EQ(backend->sessionsStarted(), 1u);
    EXPECT_EQ(backend->completed().at(*session), total);
}

TEST_F(GoogleDriveTest, ExpiredSessionStartsOverOnce) {
    cfg.resumable_threshold_bytes = 256 * 1024;
    cfg.chunk_size_bytes = 256 * 1024;
    const uint64_t total = 1 * MiB;
    const auto file = writePatternFile(dir / "clip.mp4", total);
    std::string error;

    backend->failChunkAfter(1);
    ASSERT_FALSE(upload(file, error));
    const auto oldSession = events.back().token;

    backend->expireSessions();
    events.clear();
    ASSERT_TRUE(upload(file, error, oldSession, 256 * 1024)) << error;

    EXPECT_EQ(backend->sessionsStarted(), 2u);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.front().uploaded, 0u);
    EXPECT_NE(events.front().token, oldSession);
    EXPECT_EQ(events.back().uploaded, total);
}

TEST_F(GoogleDriveTest, CommittedSessionIsNotUploadedTwice) {
    cfg.resumable_threshold_bytes = 256 * 1024;
    const auto file = writePatternFile(dir / "clip.mp4", 512 * 1024);
    std::string error;

    ASSERT_TRUE(upload(file, error));
    const auto session = events.back().token;
    const auto chunksBefore = backend->chunkCalls().size();

    ASSERT_TRUE(upload(file, error, session, 0)) << error;
    EXPECT_EQ(backend->chunkCalls().size(), chunksBefore);
}

TEST_F(GoogleDriveTest, EmptyOrMissingFileFailsWithoutNetwork) {
    const auto empty = writePatternFile(dir / "empty.mp4", 0);
    std::string error;

    EXPECT_FALSE(upload(empty, error));
    EXPECT_NE(error.find("empty"), std::string::npos);
    EXPECT_FALSE(upload(dir / "missing.mp4", error));
    EXPECT_NE(error.find("not found"), std::string::npos);
    EXPECT_TRUE(backend->requests().empty());
}

TEST_F(GoogleDriveTest, OfflineTransportFailsTheAttempt) {
    const auto file = writePatternFile(dir / "clip.mp4", 100);
    backend->setOffline(true);
    std::string error;

    EXPECT_FALSE(upload(file, error));
    EXPECT_NE(error.find("transport"), std::string::npos);
}

TEST_F(GoogleDriveTest, AuthenticationFollowsStoredCredentials) {
    auto d = drive();
    EXPECT_TRUE(d->isAuthenticated());
    d->signOut();
    EXPECT_FALSE(d->isAuthenticated());
    EXPECT_FALSE(d->authenticate());
}

namespace {

// Drive endpoint that never answers 200/201 to a chunk. `echoRange` decides whether
// chunk replies carry a Range header covering the bytes received so far.
class NeverFinishingDrive final : public wb::http::Transport {
public:
    explicit NeverFinishingDrive(const bool echoRange) : echoRange_(echoRange) {}

    wb::http::Response perform(const wb::http::Request& req) override {
        if (req.method == "POST") return makeResponse(200, {}, {{"Location", SESSION}});

        std::string contentRange;
        for (const auto& [k, v] : req.headers)
            if (k == "Content-Range") contentRange = v;

        if (contentRange.rfind("bytes */", 0) == 0) {
            ++statusQueries;
            return makeResponse(308, {}, rangeHeader_());
        }
        received_ += req.body.size();
        return makeResponse(308, {}, echoRange_ ? rangeHeader_() : std::map<std::string, std::string>{});
    }

    static constexpr const char* SESSION = "https://drive.fake.test/upload/session/stuck";
    int statusQueries = 0;

private:
    bool echoRange_;
    uint64_t received_ = 0;

    std::map<std::string, std::string> rangeHeader_() const {
        if (received_ == 0) return {};
        return {{"Range", "bytes=0-" + std::to_string(received_ - 1)}};
    }
};

}

TEST_F(GoogleDriveTest, ChunkReplyWithoutRangeIsNotProgress) {
    cfg.resumable_threshold_bytes = 100 * 1024;
    cfg.chunk_size_bytes = 256 * 1024;
    const auto file = writePatternFile(dir / "clip.mp4", 512 * 1024);
    const auto stuck = std::make_shared<NeverFinishingDrive>(false);
    std::string error;

    GoogleDrive d(stuck, creds, cfg);
    EXPECT_FALSE(d.uploadFile({file, "clip.mp4", std::nullopt, std::nullopt}, recorder(), error));
    EXPECT_FALSE(error.empty());
    ASSERT_FALSE(events.empty());
    EXPECT_LT(events.back().uploaded, 512u * 1024);
}

TEST_F(GoogleDriveTest, AllBytesAcknowledgedButNeverCompletedFails) {
    cfg.resumable_threshold_bytes = 100 * 1024;
    cfg.chunk_size_bytes = 256 * 1024;
    const auto file = writePatternFile(dir / "clip.mp4", 512 * 1024);
    const auto stuck = std::make_shared<NeverFinishingDrive>(true);
    std::string error;

    GoogleDrive d(stuck, creds, cfg);
    EXPECT_FALSE(d.uploadFile({file, "clip.mp4", std::nullopt, std::nullopt}, recorder(), error));
    EXPECT_EQ(stuck->statusQueries, 1);
    EXPECT_NE(error.find("never confirmed"), std::string::npos);
}

TEST(GoogleDriveRangeTest, ParsesCommittedRange) {
    EXPECT_EQ(committedFromRange("bytes=0-25165823"), 25165824u);
    EXPECT_EQ(committedFromRange("bytes=0-0"), 1u);
    EXPECT_FALSE(committedFromRange("bytes=0-"));
    EXPECT_FALSE(committedFromRange("garbage"));
}
