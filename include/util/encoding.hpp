#pragma once

#include <string>

namespace wb::util {

std::string base64Encode(const std::string& raw);

// RFC 3986 percent-encoding; '/' is kept when preserveSlashes is set.
std::string urlEncode(const std::string& raw, bool preserveSlashes = false);

}
