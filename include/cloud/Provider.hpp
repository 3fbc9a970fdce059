#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace wb::cloud {

struct UploadRequest {
    std::filesystem::path filePath;
    std::string fileName;
    std::optional<std::string> resumeToken;  // session handle from an earlier attempt
    std::optional<uint64_t> startByte;       // bytes confirmed by that attempt
};

// (uploaded, total, session handle). Called synchronously from the uploading thread.
using ProgressFn = std::function<void(uint64_t, uint64_t, const std::optional<std::string>&)>;

class Provider {
public:
    virtual ~Provider() = default;

    [[nodiscard]] virtual std::string displayName() const = 0;
    [[nodiscard]] virtual std::string providerId() const = 0;

    virtual bool authenticate() = 0;
    [[nodiscard]] virtual bool isAuthenticated() const = 0;
    virtual void signOut() = 0;

    // Transfers the file. On failure returns false and leaves a human readable reason in errorOut.
    virtual bool uploadFile(const UploadRequest& req, const ProgressFn& onProgress, std::string& errorOut) = 0;
};

}
