#include "util/encoding.hpp"

#include <openssl/evp.h>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <vector>

namespace wb::util {

std::string base64Encode(const std::string& raw) {
    if (raw.empty()) return {};
    std::vector<unsigned char> out(4 * ((raw.size() + 2) / 3) + 1);
    const int n = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(raw.data()),
                                  static_cast<int>(raw.size()));
    return {reinterpret_cast<const char*>(out.data()), static_cast<size_t>(n)};
}

std::string urlEncode(const std::string& raw, const bool preserveSlashes) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex;
    for (const unsigned char c : raw) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || (preserveSlashes && c == '/'))
            oss << c;
        else
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    }
    return oss.str();
}

}
