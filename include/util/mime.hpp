#pragma once

#include <string>

namespace wb::util {

// Content type by file extension, case-insensitive; application/octet-stream when unknown.
std::string mimeTypeFor(const std::string& fileName);

}
