#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace wb::types {

struct UploadTask {
    enum class Status { Pending, Uploading, Completed, Failed };

    std::string id, filePath, fileName, backendId;
    std::chrono::system_clock::time_point createdAt{};
    Status status{Status::Pending};
    unsigned int retryCount{};
    std::optional<std::string> errorMessage;
    std::optional<uint64_t> uploadedBytes, totalBytes;
    std::optional<std::string> resumeToken;
    std::optional<std::chrono::system_clock::time_point> completedAt;

    UploadTask() = default;
    UploadTask(std::string id, std::string filePath, std::string fileName, std::string backendId,
               std::chrono::system_clock::time_point createdAt = std::chrono::system_clock::now());

    // No further attempts will be made: completed, or failed with the retry budget spent.
    [[nodiscard]] bool isTerminal(unsigned int maxRetries) const;

    // Not completed and still within the retry budget.
    [[nodiscard]] bool isPending(unsigned int maxRetries) const;

    [[nodiscard]] bool hasResumePoint() const { return resumeToken && !resumeToken->empty(); }

    [[nodiscard]] double progress() const;
};

std::string to_string(const UploadTask::Status& status);
UploadTask::Status to_status(const std::string& str);

void to_json(nlohmann::json& j, const UploadTask& t);
void from_json(const nlohmann::json& j, UploadTask& t);

}
