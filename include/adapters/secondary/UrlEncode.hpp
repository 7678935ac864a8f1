#pragma once

#include <cctype>
#include <cstdio>
#include <string>

namespace vat::adapters::secondary {

/**
 * @brief Percent-encoding для сегмента пути и значения query (RFC 3986, unreserved остаются)
 */
inline std::string urlEncode(const std::string& value) {
    std::string result;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            result += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            result += buf;
        }
    }
    return result;
}

} // namespace vat::adapters::secondary
