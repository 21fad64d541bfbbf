/**
 * @file string_utils.cpp
 * @brief String utility functions implementation
 */

#include "ldiftap/utils/string_utils.h"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace ldiftap {
namespace utils {

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }

    // If all whitespace, return empty string
    if (start == str.length()) {
        return "";
    }

    size_t end = str.length();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }

    return str.substr(start, end - start);
}

std::string trimRight(const std::string& str) {
    size_t end = str.length();
    while (end > 0 && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }
    return str.substr(0, end);
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;

    if (str.empty()) {
        tokens.push_back("");  // Empty string → [""]
        return tokens;
    }

    std::string token;
    std::istringstream tokenStream(str);

    while (std::getline(tokenStream, token, delimiter)) {
        tokens.push_back(token);
    }

    // Handle trailing delimiter: "a,b," should produce ["a", "b", ""]
    if (str.back() == delimiter) {
        tokens.push_back("");
    }

    return tokens;
}

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool endsWithIgnoreCase(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size()) {
        return false;
    }
    return std::equal(suffix.rbegin(), suffix.rend(), str.rbegin(),
                      [](unsigned char a, unsigned char b) {
                          return std::tolower(a) == std::tolower(b);
                      });
}

std::string toBase64(const std::string& data) {
    if (data.empty()) {
        return "";
    }

    std::string result(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(&result[0]),
        reinterpret_cast<const unsigned char*>(data.data()),
        static_cast<int>(data.size()));
    result.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return result;
}

std::optional<std::string> fromBase64(const std::string& base64) {
    std::string clean;
    clean.reserve(base64.size());
    for (unsigned char c : base64) {
        if (!std::isspace(c)) {
            clean.push_back(static_cast<char>(c));
        }
    }

    if (clean.empty()) {
        return std::string();
    }
    if (clean.size() % 4 != 0) {
        return std::nullopt;
    }

    // Padding only at the end, at most two characters
    size_t padding = 0;
    for (size_t i = 0; i < clean.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(clean[i]);
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0) {
            return std::nullopt;
        }
        if (!std::isalnum(c) && c != '+' && c != '/') {
            return std::nullopt;
        }
    }
    if (padding > 2) {
        return std::nullopt;
    }

    std::string result(clean.size() / 4 * 3, '\0');
    int decoded = EVP_DecodeBlock(
        reinterpret_cast<unsigned char*>(&result[0]),
        reinterpret_cast<const unsigned char*>(clean.data()),
        static_cast<int>(clean.size()));
    if (decoded < 0 || static_cast<size_t>(decoded) < padding) {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts padding as zero bytes
    result.resize(static_cast<size_t>(decoded) - padding);
    return result;
}

bool isValidUtf8(const std::string& str) {
    size_t i = 0;
    const size_t n = str.size();

    while (i < n) {
        unsigned char c = static_cast<unsigned char>(str[i]);
        size_t len = 0;
        uint32_t cp = 0;

        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }

        if (i + len > n) {
            return false;
        }
        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(str[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong, surrogate and out-of-range checks
        if ((len == 2 && cp < 0x80) ||
            (len == 3 && cp < 0x800) ||
            (len == 4 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) ||
            cp > 0x10FFFF) {
            return false;
        }
        i += len;
    }
    return true;
}

bool isAscii(const std::string& str) {
    return std::all_of(str.begin(), str.end(),
                       [](unsigned char c) { return c < 0x80; });
}

std::string latin1ToUtf8(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (unsigned char c : str) {
        if (c < 0x80) {
            result.push_back(static_cast<char>(c));
        } else {
            result.push_back(static_cast<char>(0xC0 | (c >> 6)));
            result.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }
    return result;
}

} // namespace utils
} // namespace ldiftap
