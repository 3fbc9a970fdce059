#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wb::http {

struct Request {
    std::string method = "GET";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    Request& header(std::string name, std::string value) {
        headers.emplace_back(std::move(name), std::move(value));
        return *this;
    }
};

struct Response {
    int curl = 0;           // CURLcode; 0 on transport success
    std::string error;      // transport error text when curl != 0
    long http = 0;
    std::string body;
    std::string hdr;        // raw header block, as received

    [[nodiscard]] bool transportOk() const { return curl == 0; }

    // Case-insensitive lookup of the last occurrence of a response header.
    [[nodiscard]] std::optional<std::string> header(const std::string& name) const;

    // "HTTP 409: <body>" or "transport: <error>", for error messages.
    [[nodiscard]] std::string describe() const;
};

class Transport {
public:
    virtual ~Transport() = default;

    // Never throws for HTTP or network failures; these are reported through the Response.
    virtual Response perform(const Request& req) = 0;
};

// Parses a raw header block into lowercase name => value. Later duplicates win.
std::map<std::string, std::string> parseHeaders(const std::string& raw);

}
