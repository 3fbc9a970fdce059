#include "storage/FileKeyValueStore.hpp"
#include "log/Registry.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

using namespace wb::storage;
using namespace wb::log;
namespace fs = std::filesystem;

namespace {

void validateKey(const std::string& key) {
    if (key.empty()) throw std::invalid_argument("Key must not be empty");
    for (const unsigned char c : key)
        if (!std::isalnum(c) && c != '_' && c != '-' && c != '.')
            throw std::invalid_argument("Invalid character in key: " + key);
    if (key.front() == '.') throw std::invalid_argument("Key must not start with '.': " + key);
}

std::system_error errnoError(const std::string& what) {
    return {errno, std::generic_category(), what};
}

class FileLock {
public:
    explicit FileLock(const fs::path& path) : fd_(::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644)) {
        if (fd_ < 0) throw errnoError("open " + path.string());
        while (::flock(fd_, LOCK_EX) != 0) {
            if (errno == EINTR) continue;
            const auto err = errnoError("flock " + path.string());
            ::close(fd_);
            throw err;
        }
    }

    ~FileLock() {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    int fd_;
};

}

FileKeyValueStore::FileKeyValueStore(fs::path dir) : dir_(std::move(dir)) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) throw std::runtime_error("Failed to create state directory " + dir_.string() + ": " + ec.message());
}

fs::path FileKeyValueStore::valuePath_(const std::string& key) const {
    validateKey(key);
    return dir_ / (key + ".json");
}

fs::path FileKeyValueStore::lockPath_(const std::string& key) const {
    validateKey(key);
    return dir_ / (key + ".lock");
}

std::optional<std::string> FileKeyValueStore::get(const std::string& key) {
    // rename(2) publishes whole files, so a plain read needs no lock
    return read_(key);
}

void FileKeyValueStore::set(const std::string& key, const std::string& value) {
    FileLock lock(lockPath_(key));
    write_(key, value);
}

void FileKeyValueStore::remove(const std::string& key) {
    FileLock lock(lockPath_(key));
    erase_(key);
}

void FileKeyValueStore::update(const std::string& key, const Mutator& fn) {
    FileLock lock(lockPath_(key));
    const auto next = fn(read_(key));
    if (next) write_(key, *next);
    else erase_(key);
}

std::optional<std::string> FileKeyValueStore::read_(const std::string& key) const {
    const auto path = valuePath_(key);
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void FileKeyValueStore::write_(const std::string& key, const std::string& value) const {
    const auto path = valuePath_(key);
    auto tmp = path;
    tmp += ".tmp." + std::to_string(::getpid());

    const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) throw errnoError("open " + tmp.string());

    const char* p = value.data();
    size_t left = value.size();
    while (left > 0) {
        const auto n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            const auto err = errnoError("write " + tmp.string());
            ::close(fd);
            ::unlink(tmp.c_str());
            throw err;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0) Registry::store()->warn("[FileKeyValueStore] fsync {} failed: {}", tmp.string(), std::strerror(errno));
    ::close(fd);

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        const auto err = errnoError("rename " + tmp.string());
        ::unlink(tmp.c_str());
        throw err;
    }
}

void FileKeyValueStore::erase_(const std::string& key) const {
    std::error_code ec;
    fs::remove(valuePath_(key), ec);
    if (ec) throw std::runtime_error("Failed to remove key " + key + ": " + ec.message());
}
