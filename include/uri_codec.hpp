#pragma once

#include <string>
#include <cctype>

namespace llmgate {

// Percent-encodes everything except A-Z a-z 0-9 and - _ . ! ~ * ' ( ),
// so IRIs can be used as a single storage path segment or query value.
inline std::string encode_uri_component(const std::string& input) {
    static const char* hex = "0123456789ABCDEF";
    std::string result;
    result.reserve(input.size() * 3);
    for (char c : input) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '!' ||
            c == '~' || c == '*' || c == '\'' || c == '(' || c == ')') {
            result += c;
        } else {
            result += '%';
            result += hex[uc >> 4];
            result += hex[uc & 0x0F];
        }
    }
    return result;
}

}
