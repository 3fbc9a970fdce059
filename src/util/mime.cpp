#include "util/mime.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_map>

namespace wb::util {

std::string mimeTypeFor(const std::string& fileName) {
    static const std::unordered_map<std::string, std::string> types = {
        {".mp4", "video/mp4"},
        {".m4v", "video/x-m4v"},
        {".mov", "video/quicktime"},
        {".avi", "video/x-msvideo"},
        {".mkv", "video/x-matroska"},
        {".webm", "video/webm"},
        {".3gp", "video/3gpp"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".png", "image/png"},
        {".heic", "image/heic"},
        {".m4a", "audio/mp4"},
        {".aac", "audio/aac"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".json", "application/json"},
        {".txt", "text/plain"},
    };

    auto ext = std::filesystem::path(fileName).extension().string();
    std::ranges::transform(ext, ext.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (const auto it = types.find(ext); it != types.end()) return it->second;
    return "application/octet-stream";
}

}
