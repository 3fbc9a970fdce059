#include "types/UploadTask.hpp"
#include "util/timestamp.hpp"

#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace wb::types;
using namespace wb::util;

UploadTask::UploadTask(std::string id, std::string filePath, std::string fileName, std::string backendId,
                       const std::chrono::system_clock::time_point createdAt)
    : id(std::move(id)),
      filePath(std::move(filePath)),
      fileName(std::move(fileName)),
      backendId(std::move(backendId)),
      createdAt(createdAt) {}

bool UploadTask::isTerminal(const unsigned int maxRetries) const {
    return status == Status::Completed || (status == Status::Failed && retryCount >= maxRetries);
}

bool UploadTask::isPending(const unsigned int maxRetries) const {
    return status != Status::Completed && retryCount < maxRetries;
}

double UploadTask::progress() const {
    if (!uploadedBytes || !totalBytes || *totalBytes == 0) return status == Status::Completed ? 1.0 : 0.0;
    return static_cast<double>(*uploadedBytes) / static_cast<double>(*totalBytes);
}

std::string wb::types::to_string(const UploadTask::Status& status) {
    switch (status) {
        case UploadTask::Status::Pending: return "pending";
        case UploadTask::Status::Uploading: return "uploading";
        case UploadTask::Status::Completed: return "completed";
        case UploadTask::Status::Failed: return "failed";
        default: return "unknown";
    }
}

UploadTask::Status wb::types::to_status(const std::string& str) {
    if (str == "pending") return UploadTask::Status::Pending;
    if (str == "uploading") return UploadTask::Status::Uploading;
    if (str == "completed") return UploadTask::Status::Completed;
    if (str == "failed") return UploadTask::Status::Failed;
    throw std::invalid_argument("Invalid upload status string: " + str);
}

void wb::types::to_json(nlohmann::json& j, const UploadTask& t) {
    j = nlohmann::json{
        {"id", t.id},
        {"filePath", t.filePath},
        {"fileName", t.fileName},
        {"backendId", t.backendId},
        {"createdAt", toIso8601(t.createdAt)},
        {"status", to_string(t.status)},
        {"retryCount", t.retryCount},
        {"errorMessage", t.errorMessage ? nlohmann::json(*t.errorMessage) : nlohmann::json(nullptr)},
        {"uploadedBytes", t.uploadedBytes ? nlohmann::json(*t.uploadedBytes) : nlohmann::json(nullptr)},
        {"totalBytes", t.totalBytes ? nlohmann::json(*t.totalBytes) : nlohmann::json(nullptr)},
        {"resumeToken", t.resumeToken ? nlohmann::json(*t.resumeToken) : nlohmann::json(nullptr)}
    };
    if (t.completedAt) j["completedAt"] = toIso8601(*t.completedAt);
}

namespace {

template <typename T>
std::optional<T> optionalField(const nlohmann::json& j, const char* key, const char* legacyKey = nullptr) {
    if (j.contains(key) && !j[key].is_null()) return j[key].get<T>();
    if (legacyKey && j.contains(legacyKey) && !j[legacyKey].is_null()) return j[legacyKey].get<T>();
    return std::nullopt;
}

}

void wb::types::from_json(const nlohmann::json& j, UploadTask& t) {
    t.id = j.at("id").get<std::string>();
    t.filePath = j.at("filePath").get<std::string>();
    t.fileName = j.at("fileName").get<std::string>();

    // records written by the mobile client use cloudStorageId / resumableSessionUri
    if (const auto backend = optionalField<std::string>(j, "backendId", "cloudStorageId")) t.backendId = *backend;
    else throw std::invalid_argument("Upload task " + t.id + " has no backendId");

    t.createdAt = parseIso8601(j.at("createdAt").get<std::string>());
    t.status = to_status(j.value("status", std::string("pending")));
    t.retryCount = j.value("retryCount", 0u);
    t.errorMessage = optionalField<std::string>(j, "errorMessage");
    t.uploadedBytes = optionalField<uint64_t>(j, "uploadedBytes");
    t.totalBytes = optionalField<uint64_t>(j, "totalBytes");
    t.resumeToken = optionalField<std::string>(j, "resumeToken", "resumableSessionUri");

    if (const auto completed = optionalField<std::string>(j, "completedAt")) t.completedAt = parseIso8601(*completed);
    else t.completedAt.reset();
}
