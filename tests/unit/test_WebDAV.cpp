#include <gtest/gtest.h>
#include "cloud/WebDAV.hpp"
#include "storage/MemoryKeyValueStore.hpp"
#include "support/FakeBackend.hpp"
#include "support/TestFiles.hpp"

using namespace wb::cloud;
using namespace wb::test;
using wb::config::MiB;

class WebDAVTest : public ::testing::Test {
protected:
    struct Event {
        uint64_t uploaded, total;
        std::optional<std::string> token;
    };

    TempDir dir;
    std::shared_ptr<FakeBackend> backend = std::make_shared<FakeBackend>();
    std::shared_ptr<CredentialStore> creds = std::make_shared<CredentialStore>(std::make_shared<wb::storage::MemoryKeyValueStore>());
    wb::config::WebDAVConfig cfg;
    std::vector<Event> events;

    void SetUp() override {
        Credentials c;
        c.base_uri = std::string(FakeBackend::DAV_BASE) + "/";
        c.username = "alice";
        c.password = "secret";
        c.is_authenticated = true;
        creds->save(WebDAV::ID, c);
    }

    std::unique_ptr<WebDAV> dav() const { return std::make_unique<WebDAV>(backend, creds, cfg); }

    bool upload(const std::filesystem::path& file, const std::string& name, std::string& error,
                const std::optional<std::string>& token = std::nullopt, const std::optional<uint64_t>& start = std::nullopt) {
        const ProgressFn fn = [this](const uint64_t u, const uint64_t t, const std::optional<std::string>& tok) {
            events.push_back({u, t, tok});
        };
        return dav()->uploadFile({file, name, token, start}, fn, error);
    }

    static std::string url(const std::string& encodedName) { return std::string(FakeBackend::DAV_BASE) + "/" + encodedName; }
};

TEST_F(WebDAVTest, ConfigureValidatesWithPropfind) {
    ASSERT_TRUE(dav()->configure(FakeBackend::DAV_BASE, "alice", "secret"));

    const auto reqs = backend->requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].method, "PROPFIND");
    std::map<std::string, std::string> headers(reqs[0].headers.begin(), reqs[0].headers.end());
    EXPECT_EQ(headers["Depth"], "0");
    EXPECT_EQ(headers["Authorization"], "Basic YWxpY2U6c2VjcmV0");
    EXPECT_TRUE(dav()->isAuthenticated());
}

TEST_F(WebDAVTest, RejectedCredentialsAreRecorded) {
    backend->setPropfindStatus(401);

    EXPECT_FALSE(dav()->configure(FakeBackend::DAV_BASE, "alice", "wrong"));
    EXPECT_FALSE(dav()->isAuthenticated());
    EXPECT_FALSE(creds->load(WebDAV::ID).is_authenticated);
    EXPECT_EQ(creds->load(WebDAV::ID).username, "alice");
}

TEST_F(WebDAVTest, MissingServerIsNotAuthenticated) {
    creds->clear(WebDAV::ID);
    EXPECT_FALSE(dav()->isAuthenticated());
    EXPECT_FALSE(dav()->authenticate());
    EXPECT_TRUE(backend->requests().empty());
}

TEST_F(WebDAVTest, SmallFileIsSinglePut) {
    const auto file = writePatternFile(dir / "clip.mp4", 2048);
    std::string error;

    ASSERT_TRUE(upload(file, "clip one.mp4", error)) << error;

    EXPECT_EQ(backend->simpleBody(url("clip%20one.mp4")), readFile(file));
    EXPECT_EQ(backend->requestCount("HEAD"), 0u);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].uploaded, 2048u);
}

TEST_F(WebDAVTest, LargeFileUsesContentRangePuts) {
    cfg.chunk_size_bytes = 1 * MiB;
    const uint64_t total = 2 * MiB + MiB / 2;
    const auto file = writePatternFile(dir / "clip.mp4", total);
    std::string error;

    ASSERT_TRUE(upload(file, "clip.mp4", error)) << error;

    const auto chunks = backend->successfulChunks();
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[1].offset, 1 * MiB);
    EXPECT_EQ(chunks[2].status, 201);
    EXPECT_EQ(events.front().token, url("clip.mp4"));
    EXPECT_EQ(backend->completed().at(url("clip.mp4")), total);
}

TEST_F(WebDAVTest, ResumeUsesTargetUrlAsHandle) {
    cfg.chunk_size_bytes = 1 * MiB;
    const uint64_t total = 3 * MiB;
    const auto file = writePatternFile(dir / "clip.mp4", total);
    std::string error;

    backend->failChunkAfter(1);
    ASSERT_FALSE(upload(file, "clip.mp4", error));
    ASSERT_EQ(events.back().uploaded, 1 * MiB);
    ASSERT_EQ(events.back().token, url("clip.mp4"));

    const auto before = backend->chunkCalls().size();
    ASSERT_TRUE(upload(file, "clip.mp4", error, events.back().token, events.back().uploaded)) << error;

    EXPECT_EQ(backend->chunkCalls().at(before).offset, 1 * MiB);
    EXPECT_EQ(backend->completed().at(url("clip.mp4")), total);
}

TEST_F(WebDAVTest, AutoRenamePicksFirstFreeName) {
    cfg.auto_rename = true;
    backend->addExistingFile(url("clip.mp4"));
    backend->addExistingFile(url("clip%20%281%29.mp4"));
    const auto file = writePatternFile(dir / "clip.mp4", 100);
    std::string error;

    ASSERT_TRUE(upload(file, "clip.mp4", error)) << error;

    EXPECT_TRUE(backend->simpleBody(url("clip%20%282%29.mp4")));
    EXPECT_FALSE(backend->simpleBody(url("clip.mp4")));
    EXPECT_EQ(backend->requestCount("HEAD"), 3u);
}

TEST_F(WebDAVTest, WithoutAutoRenameExistingFileIsOverwritten) {
    backend->addExistingFile(url("clip.mp4"));
    const auto file = writePatternFile(dir / "clip.mp4", 100);
    std::string error;

    ASSERT_TRUE(upload(file, "clip.mp4", error)) << error;
    EXPECT_TRUE(backend->simpleBody(url("clip.mp4")));
    EXPECT_EQ(backend->requestCount("HEAD"), 0u);
}

TEST(WebDAVNamingTest, NumberedNameKeepsExtension) {
    EXPECT_EQ(numberedName("clip.mp4", 2), "clip (2).mp4");
    EXPECT_EQ(numberedName("archive.tar.gz", 1), "archive.tar (1).gz");
    EXPECT_EQ(numberedName("README", 1), "README (1)");
    EXPECT_EQ(numberedName(".hidden", 3), ".hidden (3)");
}
