#include <gtest/gtest.h>
#include "upload/Orchestrator.hpp"
#include "upload/UploadScheduler.hpp"
#include "upload/ProgressPublisher.hpp"
#include "upload/TaskStore.hpp"
#include "cloud/ProviderRegistry.hpp"
#include "cloud/CredentialStore.hpp"
#include "storage/MemoryKeyValueStore.hpp"
#include "support/FakeBackend.hpp"
#include "support/TestFiles.hpp"

#include <map>

using namespace wb::upload;
using namespace wb::cloud;
using namespace wb::jobs;
using namespace wb::test;
using wb::types::UploadTask;
using namespace std::chrono_literals;

namespace {

// Holds registered jobs until run() is called.
class DeferredScheduler final : public JobScheduler {
public:
    void registerWorker(const std::string& name, JobHandler handler) override { workers_[name] = std::move(handler); }

    bool registerOneOffJob(const JobRequest& req) override {
        for (const auto& q : queued_)
            if (q.id == req.id) return false;
        queued_.push_back(req);
        return true;
    }

    bool cancelJob(const std::string& id) override {
        return std::erase_if(queued_, [&](const JobRequest& r) { return r.id == id; }) > 0;
    }

    size_t cancelJobsByTag(const std::string& tag) override {
        return std::erase_if(queued_, [&](const JobRequest& r) { return r.tag == tag; });
    }

    size_t queued() const { return queued_.size(); }

    void run() {
        auto pending = std::move(queued_);
        queued_.clear();
        for (const auto& req : pending) workers_.at(req.name)(req.payload);
    }

private:
    std::map<std::string, JobHandler> workers_;
    std::vector<JobRequest> queued_;
};

}

class OrchestratorTest : public ::testing::Test {
protected:
    TempDir dir;
    std::shared_ptr<wb::storage::MemoryKeyValueStore> settings = std::make_shared<wb::storage::MemoryKeyValueStore>();
    std::shared_ptr<FakeBackend> backend = std::make_shared<FakeBackend>();
    std::shared_ptr<TaskStore> store = std::make_shared<TaskStore>(settings, 3);
    std::shared_ptr<CredentialStore> creds = std::make_shared<CredentialStore>(settings);
    std::shared_ptr<DeferredScheduler> jobs = std::make_shared<DeferredScheduler>();
    std::shared_ptr<ProviderRegistry> providers;
    std::shared_ptr<UploadScheduler> scheduler;
    std::shared_ptr<ProgressPublisher> publisher = std::make_shared<ProgressPublisher>(store);

    void SetUp() override {
        wb::config::ProvidersConfig pcfg;
        pcfg.dropbox.content_endpoint = FakeBackend::DROPBOX_ENDPOINT;
        providers = ProviderRegistry::withDefaults(backend, creds, pcfg);

        Credentials c;
        c.access_token = "tok";
        c.is_authenticated = true;
        creds->save("dropbox", c);

        wb::config::UploadConfig cfg;
        cfg.completed_grace = 1ms;
        cfg.requires_network = false;
        scheduler = std::make_shared<UploadScheduler>(store, providers, jobs, cfg);
    }

    std::unique_ptr<Orchestrator> orchestrator() const {
        return std::make_unique<Orchestrator>(settings, providers, scheduler, publisher);
    }
};

TEST_F(OrchestratorTest, NothingIsUploadedWhileBackupIsOff) {
    const auto o = orchestrator();
    const auto file = writePatternFile(dir / "clip.mp4", 10);

    EXPECT_EQ(o->selectedBackend(), ProviderRegistry::NONE_ID);
    EXPECT_FALSE(o->onFileProduced(file));
    EXPECT_TRUE(store->getAll().empty());
    EXPECT_EQ(jobs->queued(), 0u);
}

TEST_F(OrchestratorTest, SelectionIsPersisted) {
    orchestrator()->selectBackend("dropbox");

    EXPECT_EQ(settings->get(Orchestrator::SELECTED_BACKEND_KEY), "dropbox");
    EXPECT_EQ(orchestrator()->selectedBackend(), "dropbox");

    orchestrator()->selectBackend(ProviderRegistry::NONE_ID);
    EXPECT_EQ(orchestrator()->selectedBackend(), ProviderRegistry::NONE_ID);
}

TEST_F(OrchestratorTest, UnknownSelectionIsRejected) {
    const auto o = orchestrator();
    o->selectBackend("webdav");

    EXPECT_THROW(o->selectBackend("ftp"), std::invalid_argument);
    EXPECT_EQ(o->selectedBackend(), "webdav");
}

TEST_F(OrchestratorTest, StaleSelectionSkipsUpload) {
    settings->set(Orchestrator::SELECTED_BACKEND_KEY, "box");
    const auto file = writePatternFile(dir / "clip.mp4", 10);

    EXPECT_FALSE(orchestrator()->onFileProduced(file));
    EXPECT_TRUE(store->getAll().empty());
}

TEST_F(OrchestratorTest, MissingRecordingIsReportedNotThrown) {
    orchestrator()->selectBackend("dropbox");

    EXPECT_FALSE(orchestrator()->onFileProduced(dir / "gone.mp4"));
    EXPECT_TRUE(store->getAll().empty());
}

TEST_F(OrchestratorTest, ProducedFileIsQueuedPublishedAndUploaded) {
    const auto o = orchestrator();
    o->selectBackend("dropbox");
    const auto file = writePatternFile(dir / "raw_0001.mp4", 4096);

    std::vector<ProgressPublisher::Snapshot> seen;
    auto sub = publisher->subscribe([&](const ProgressPublisher::Snapshot& s) { seen.push_back(s); });

    const auto id = o->onFileProduced(file, "witness_2026-10-18.mp4");
    ASSERT_TRUE(id);

    ASSERT_EQ(seen.size(), 1u);
    ASSERT_EQ(seen[0].size(), 1u);
    EXPECT_EQ(seen[0][0].id, *id);
    EXPECT_EQ(seen[0][0].fileName, "witness_2026-10-18.mp4");
    EXPECT_EQ(seen[0][0].status, UploadTask::Status::Pending);
    EXPECT_EQ(jobs->queued(), 1u);

    jobs->run();

    EXPECT_EQ(backend->completed().at("/witness_2026-10-18.mp4"), 4096u);
    EXPECT_TRUE(publisher->refresh().empty());
}

TEST_F(OrchestratorTest, StartupRecoversTasksLeftByPreviousRun) {
    const auto a = writePatternFile(dir / "a.mp4", 100);
    const auto b = writePatternFile(dir / "b.mp4", 100);

    UploadTask interrupted("upload_1", a.string(), "a.mp4", "dropbox");
    interrupted.status = UploadTask::Status::Uploading;
    UploadTask exhausted("upload_2", b.string(), "b.mp4", "dropbox");
    exhausted.status = UploadTask::Status::Failed;
    exhausted.retryCount = 3;
    store->add(interrupted);
    store->add(exhausted);

    orchestrator()->selectBackend("dropbox");
    EXPECT_EQ(orchestrator()->onStartup(), 1u);
    EXPECT_EQ(publisher->latest().size(), 2u);

    jobs->run();
    EXPECT_TRUE(backend->completed().contains("/a.mp4"));
    EXPECT_FALSE(backend->completed().contains("/b.mp4"));
}

TEST_F(OrchestratorTest, StartupSweepRunsEvenWhenSignedOut) {
    creds->clear("dropbox");
    const auto a = writePatternFile(dir / "a.mp4", 100);
    store->add({"upload_1", a.string(), "a.mp4", "dropbox"});

    orchestrator()->selectBackend("dropbox");
    EXPECT_EQ(orchestrator()->onStartup(), 1u);

    jobs->run();
    const auto task = store->get("upload_1");
    ASSERT_TRUE(task);
    EXPECT_EQ(task->status, UploadTask::Status::Failed);
    EXPECT_EQ(task->retryCount, 1u);
}
