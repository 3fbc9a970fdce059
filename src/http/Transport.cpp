#include "http/Transport.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <fmt/format.h>

namespace wb::http {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}

std::map<std::string, std::string> parseHeaders(const std::string& raw) {
    std::map<std::string, std::string> out;
    std::istringstream iss(raw);
    std::string line;
    while (std::getline(iss, line)) {
        // a new status line starts a fresh block (e.g. after "100 Continue")
        if (line.rfind("HTTP/", 0) == 0) {
            out.clear();
            continue;
        }
        const auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        out[lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return out;
}

std::optional<std::string> Response::header(const std::string& name) const {
    const auto headers = parseHeaders(hdr);
    if (const auto it = headers.find(lower(name)); it != headers.end()) return it->second;
    return std::nullopt;
}

std::string Response::describe() const {
    if (!transportOk()) return fmt::format("transport error {}: {}", curl, error);
    if (body.empty()) return fmt::format("HTTP {}", http);
    constexpr size_t maxBody = 512;
    return fmt::format("HTTP {}: {}", http, body.size() > maxBody ? body.substr(0, maxBody) + "..." : body);
}

}
