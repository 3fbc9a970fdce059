#include <gtest/gtest.h>
#include "storage/FileKeyValueStore.hpp"
#include "storage/MemoryKeyValueStore.hpp"
#include "support/TestFiles.hpp"

#include <thread>
#include <vector>

using namespace wb::storage;
using namespace wb::test;
namespace fs = std::filesystem;

class FileKeyValueStoreTest : public ::testing::Test {
protected:
    TempDir dir;
};

TEST_F(FileKeyValueStoreTest, SetGetRemove) {
    FileKeyValueStore kv(dir.path());
    EXPECT_FALSE(kv.get("cloud_storage"));

    kv.set("cloud_storage", "dropbox");
    EXPECT_EQ(kv.get("cloud_storage"), "dropbox");
    EXPECT_TRUE(fs::exists(dir / "cloud_storage.json"));

    kv.remove("cloud_storage");
    EXPECT_FALSE(kv.get("cloud_storage"));
}

TEST_F(FileKeyValueStoreTest, ValuesSurviveANewInstance) {
    FileKeyValueStore(dir.path()).set("upload_queue", "[]");
    EXPECT_EQ(FileKeyValueStore(dir.path()).get("upload_queue"), "[]");
}

TEST_F(FileKeyValueStoreTest, RejectsKeysThatEscapeTheDirectory) {
    FileKeyValueStore kv(dir.path());
    EXPECT_THROW(kv.set("../etc/passwd", "x"), std::invalid_argument);
    EXPECT_THROW(kv.get(""), std::invalid_argument);
    EXPECT_THROW(kv.set(".hidden", "x"), std::invalid_argument);
}

TEST_F(FileKeyValueStoreTest, UpdateReturningNulloptRemoves) {
    FileKeyValueStore kv(dir.path());
    kv.set("k", "v");
    kv.update("k", [](const std::optional<std::string>& cur) -> std::optional<std::string> {
        EXPECT_EQ(cur, "v");
        return std::nullopt;
    });
    EXPECT_FALSE(kv.get("k"));
}

TEST_F(FileKeyValueStoreTest, ConcurrentUpdatesFromSeparateHandlesAreNotLost) {
    constexpr int threads = 4, perThread = 50;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([this] {
            // separate instance per thread, as separate processes would have
            FileKeyValueStore kv(dir.path());
            for (int i = 0; i < perThread; ++i) {
                kv.update("counter", [](const std::optional<std::string>& cur) -> std::optional<std::string> {
                    return std::to_string((cur ? std::stoi(*cur) : 0) + 1);
                });
            }
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(FileKeyValueStore(dir.path()).get("counter"), std::to_string(threads * perThread));

    for (const auto& entry : fs::directory_iterator(dir.path()))
        EXPECT_EQ(entry.path().string().find(".tmp."), std::string::npos) << entry.path();
}

TEST(MemoryKeyValueStoreTest, UpdateSeesCurrentValue) {
    MemoryKeyValueStore kv;
    kv.update("k", [](const std::optional<std::string>& cur) -> std::optional<std::string> {
        EXPECT_FALSE(cur);
        return "1";
    });
    kv.update("k", [](const std::optional<std::string>& cur) -> std::optional<std::string> { return *cur + "2"; });
    EXPECT_EQ(kv.get("k"), "12");
}
