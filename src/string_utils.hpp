#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <cctype>
#include <cstdio>

namespace rexbind {
namespace string_utils {

// Join strings with separator
inline std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string result;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) result += sep;
        result += parts[i];
    }
    return result;
}

// Make non-printable characters visible
inline std::string make_printable(std::string_view content) {
    std::string result;
    for (unsigned char ch : content) {
        if (std::isprint(ch) || std::isspace(ch)) {
            result += static_cast<char>(ch);
        } else {
            // Format as <0xHH>
            char buf[8];
            std::snprintf(buf, sizeof(buf), "<0x%02x>", ch);
            result += buf;
        }
    }
    return result;
}

} // namespace string_utils
} // namespace rexbind
