// Upload pipeline
#include "upload/Orchestrator.hpp"
#include "upload/UploadScheduler.hpp"
#include "upload/TaskStore.hpp"
#include "upload/ProgressPublisher.hpp"
#include "upload/ProgressPoller.hpp"

// Backends
#include "cloud/ProviderRegistry.hpp"
#include "cloud/CredentialStore.hpp"
#include "cloud/WebDAV.hpp"
#include "http/CurlTransport.hpp"

// Jobs & storage
#include "jobs/JobRunner.hpp"
#include "jobs/InlineScheduler.hpp"
#include "storage/FileKeyValueStore.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "types/UploadTask.hpp"
#include "util/cmdLineHelpers.hpp"
#include "util/timestamp.hpp"

// Libraries
#include <algorithm>
#include <atomic>
#include <csignal>
#include <iostream>
#include <thread>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace wb;
using namespace wb::config;
using namespace wb::upload;
using namespace wb::cloud;
using namespace wb::jobs;
using namespace wb::log;

namespace {

std::atomic shouldExit = false;
std::atomic reopenLog = false;

void signalHandler(const int signum) {
    if (signum == SIGHUP) reopenLog = true;
    else shouldExit = true;
}

struct Runtime {
    std::shared_ptr<storage::FileKeyValueStore> kv;
    std::shared_ptr<TaskStore> store;
    std::shared_ptr<CredentialStore> credentials;
    std::shared_ptr<ProviderRegistry> providers;
    std::shared_ptr<JobScheduler> jobs;
    std::shared_ptr<UploadScheduler> scheduler;
    std::shared_ptr<ProgressPublisher> publisher;
    std::shared_ptr<Orchestrator> orchestrator;
};

Runtime makeRuntime(std::shared_ptr<JobScheduler> jobs) {
    const auto& cfg = ConfigRegistry::get();

    Runtime rt;
    rt.kv = std::make_shared<storage::FileKeyValueStore>(cfg.state.directory);
    rt.store = std::make_shared<TaskStore>(rt.kv, cfg.upload.max_retries);
    rt.credentials = std::make_shared<CredentialStore>(rt.kv);
    rt.providers = ProviderRegistry::withDefaults(std::make_shared<http::CurlTransport>(cfg.http), rt.credentials,
                                                  cfg.providers);
    rt.jobs = std::move(jobs);
    rt.scheduler = std::make_shared<UploadScheduler>(rt.store, rt.providers, rt.jobs, cfg.upload);
    rt.publisher = std::make_shared<ProgressPublisher>(rt.store);
    rt.orchestrator = std::make_shared<Orchestrator>(rt.kv, rt.providers, rt.scheduler, rt.publisher);
    return rt;
}

void usage() {
    std::cerr <<
        "usage: witnessbackup [--config PATH] <command> [args...]\n"
        "\n"
        "commands:\n"
        "  run                            run the upload daemon\n"
        "  enqueue <file> [--name N] [--now]\n"
        "                                 queue a file for the selected backend\n"
        "  process [taskId]               run one upload attempt in the foreground\n"
        "  status [--json]                list queued uploads\n"
        "  cancel <taskId>                drop a queued upload\n"
        "  cancel-all                     drop every queued upload\n"
        "  clear                          drop completed and exhausted uploads\n"
        "  select <backend>               choose the backend (or 'none')\n"
        "  backends                       list available backends\n"
        "  auth <backend> [args...]       store credentials for a backend\n"
        "                                 google_drive|dropbox: <access_token> [refresh_token]\n"
        "                                 webdav: <base_uri> <username> <password>\n"
        "  signout <backend>              forget a backend's credentials\n";
}

std::string describeProgress(const types::UploadTask& t) {
    if (!t.totalBytes) return "-";
    return fmt::format("{} {} / {}", shell::progress_bar(t.progress(), 20),
                       shell::human_bytes(t.uploadedBytes.value_or(0)), shell::human_bytes(*t.totalBytes));
}

int cmdRun() {
    const auto& cfg = ConfigRegistry::get();
    Registry::witness()->info("[*] Starting witnessbackup upload daemon...");

    const auto runner = std::make_shared<JobRunner>(cfg.upload.worker_threads);
    const auto rt = makeRuntime(runner);
    runner->start();

    const auto recovered = rt.orchestrator->onStartup();
    Registry::witness()->info("[*] Recovery sweep registered {} upload(s)", recovered);

    ProgressPoller poller(rt.publisher, cfg.upload.poll_interval);
    size_t lastActive = 0;
    auto sub = rt.publisher->subscribe([&lastActive](const ProgressPublisher::Snapshot& tasks) {
        const auto active = static_cast<size_t>(std::ranges::count_if(tasks, [](const types::UploadTask& t) {
            return t.status == types::UploadTask::Status::Uploading;
        }));
        if (active != lastActive) Registry::witness()->info("[*] {} upload(s) in progress, {} queued", active, tasks.size());
        lastActive = active;
    });
    poller.start();

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGHUP, signalHandler);

    Registry::witness()->info("[✓] witnessbackup daemon running");

    auto lastScan = std::chrono::steady_clock::now();
    while (!shouldExit) {
        std::this_thread::sleep_for(std::chrono::seconds(1));

        if (reopenLog.exchange(false)) Registry::reopenMainLog();

        if (std::chrono::steady_clock::now() - lastScan >= cfg.upload.rescan_interval) {
            rt.scheduler->adoptNewTasks();
            lastScan = std::chrono::steady_clock::now();
        }
    }

    Registry::witness()->info("[!] Shutting down...");
    poller.stop();
    runner->stop();
    Registry::witness()->info("[✓] witnessbackup stopped");
    return 0;
}

int cmdEnqueue(const std::vector<std::string>& args) {
    std::optional<std::string> file, name;
    bool now = false;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--now") now = true;
        else if (args[i] == "--name" && i + 1 < args.size()) name = args[++i];
        else if (!file) file = args[i];
        else {
            usage();
            return 2;
        }
    }
    if (!file) {
        usage();
        return 2;
    }

    now = now || ConfigRegistry::get().upload.immediate;

    // the runner is never started: the daemon adopts the persisted task, or --now runs it here
    const auto rt = makeRuntime(std::make_shared<JobRunner>(1));
    const auto id = rt.orchestrator->onFileProduced(*file, name);
    if (!id) {
        fmt::print(stderr, "Not queued (selected backend: {})\n", rt.orchestrator->selectedBackend());
        return 1;
    }

    fmt::print("{}\n", *id);
    if (now && !rt.scheduler->processTask(*id)) {
        const auto task = rt.store->get(*id);
        fmt::print(stderr, "Upload failed: {}\n",
                   task ? task->errorMessage.value_or(types::to_string(task->status)) : "task dropped (source file missing)");
        return 1;
    }
    return 0;
}

int cmdProcess(const std::vector<std::string>& args) {
    const auto rt = makeRuntime(std::make_shared<InlineScheduler>());
    std::string id = args.empty() ? std::string() : args.front();
    if (id.empty()) {
        const auto pending = rt.store->getPending();
        if (pending.empty()) {
            fmt::print("No pending uploads\n");
            return 0;
        }
        id = pending.front().id;
    }

    if (rt.scheduler->processTask(id)) {
        fmt::print("{} uploaded\n", id);
        return 0;
    }

    const auto task = rt.store->get(id);
    fmt::print(stderr, "{} not uploaded: {}\n", id,
               task ? task->errorMessage.value_or(types::to_string(task->status)) : "no such task");
    return 1;
}

int cmdStatus(const std::vector<std::string>& args) {
    const auto rt = makeRuntime(std::make_shared<InlineScheduler>());
    const auto tasks = rt.store->getAll();

    if (!args.empty() && args.front() == "--json") {
        fmt::print("{}\n", nlohmann::json(tasks).dump(2));
        return 0;
    }

    if (tasks.empty()) {
        fmt::print("No uploads queued\n");
        return 0;
    }

    const auto width = static_cast<size_t>(std::max(shell::term_width() - 70, 16));
    for (const auto& t : tasks) {
        fmt::print("{:<24} {:<10} {:<9} {:<44} {}\n", t.id, types::to_string(t.status), t.backendId,
                   describeProgress(t), shell::ellipsize_middle(t.fileName, width));
        if (t.errorMessage) fmt::print("    retry {}/{}: {}\n", t.retryCount, rt.store->maxRetries(), *t.errorMessage);
    }
    return 0;
}

int cmdAuth(const std::vector<std::string>& args) {
    if (args.empty()) {
        usage();
        return 2;
    }

    const auto rt = makeRuntime(std::make_shared<InlineScheduler>());
    const auto& id = args.front();
    const auto provider = rt.providers->create(id);
    if (!provider) {
        fmt::print(stderr, "Unknown backend: {}\n", id);
        return 2;
    }

    if (id == WebDAV::ID) {
        if (args.size() < 4) {
            usage();
            return 2;
        }
        const auto webdav = std::dynamic_pointer_cast<WebDAV>(provider);
        if (!webdav || !webdav->configure(args[1], args[2], args[3])) {
            fmt::print(stderr, "Could not connect to {}\n", args[1]);
            return 1;
        }
    } else if (args.size() >= 2) {
        Credentials c;
        c.access_token = args[1];
        if (args.size() >= 3) c.refresh_token = args[2];
        c.is_authenticated = true;
        rt.credentials->save(id, c);
    }

    if (!provider->authenticate()) {
        fmt::print(stderr, "{} is not signed in\n", provider->displayName());
        return 1;
    }
    fmt::print("{} signed in\n", provider->displayName());
    return 0;
}

int dispatch(const std::string& cmd, const std::vector<std::string>& args) {
    if (cmd == "run") return cmdRun();
    if (cmd == "enqueue") return cmdEnqueue(args);
    if (cmd == "process") return cmdProcess(args);
    if (cmd == "status") return cmdStatus(args);
    if (cmd == "auth") return cmdAuth(args);

    const auto rt = makeRuntime(std::make_shared<InlineScheduler>());

    if (cmd == "cancel") {
        if (args.empty()) {
            usage();
            return 2;
        }
        if (!rt.scheduler->cancel(args.front())) {
            fmt::print(stderr, "No such upload: {}\n", args.front());
            return 1;
        }
        return 0;
    }

    if (cmd == "cancel-all") {
        fmt::print("Cancelled {} upload(s)\n", rt.scheduler->cancelAll());
        return 0;
    }

    if (cmd == "clear") {
        fmt::print("Cleared {} upload(s)\n", rt.store->clearFinished());
        return 0;
    }

    if (cmd == "select") {
        if (args.empty()) {
            usage();
            return 2;
        }
        rt.orchestrator->selectBackend(args.front());
        return 0;
    }

    if (cmd == "backends") {
        const auto selected = rt.orchestrator->selectedBackend();
        for (const auto& [id, name] : rt.providers->available())
            fmt::print("{} {:<14} {}\n", id == selected ? '*' : ' ', id, name);
        return 0;
    }

    if (cmd == "signout") {
        if (args.empty()) {
            usage();
            return 2;
        }
        const auto provider = rt.providers->create(args.front());
        if (!provider) {
            fmt::print(stderr, "Unknown backend: {}\n", args.front());
            return 2;
        }
        provider->signOut();
        return 0;
    }

    usage();
    return 2;
}

}

int main(const int argc, char** argv) {
    std::filesystem::path configOverride;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) configOverride = argv[++i];
        else if (a == "-h" || a == "--help") {
            usage();
            return 0;
        } else args.push_back(a);
    }

    if (args.empty()) {
        usage();
        return 2;
    }

    const auto cmd = args.front();
    args.erase(args.begin());

    try {
        ConfigRegistry::init(resolveConfigPath(configOverride));
        Registry::init(cmd == "run" ? ConfigRegistry::get().logging.log_dir : std::filesystem::path{});
        return dispatch(cmd, args);
    } catch (const std::exception& e) {
        if (Registry::isInitialized()) Registry::witness()->critical("[!] Fatal: {}", e.what());
        fmt::print(stderr, "witnessbackup: {}\n", e.what());
        return 1;
    }
}
