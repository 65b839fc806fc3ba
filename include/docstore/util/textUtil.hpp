#pragma once
/// @file textUtil.hpp
/// @brief String helpers shared by repositories, schema and tenant code

#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <string>
#include <system_error>

namespace DocStore::util {

// 숫자 문자열을 long으로 엄격하게 변환한다.
// - 문자열 전체를 소비하지 못하면 invalid_argument로 실패한다.
// - long 범위를 벗어나면 result_out_of_range로 실패한다.
inline bool parseLongStrict(const std::string& s, long& out, std::error_code& ec) {
    ec.clear();
    if (s.empty() || std::isspace(static_cast<unsigned char>(s.front()))) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (end != s.c_str() + s.size()) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    if (errno == ERANGE || v < static_cast<long long>(std::numeric_limits<long>::min()) ||
        v > static_cast<long long>(std::numeric_limits<long>::max())) {
        ec = std::make_error_code(std::errc::result_out_of_range);
        return false;
    }
    out = static_cast<long>(v);
    return true;
}

/// @brief Strip leading/trailing whitespace
inline std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

/// @brief ASCII lower-case copy
inline std::string toLower(std::string s) {
    for (auto& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

/// @brief Key used for name comparisons: trimmed and lower-cased
inline std::string normalizeKey(const std::string& s) { return toLower(trim(s)); }

/// @brief Case-insensitive substring test
inline bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

/// @brief 64-bit FNV-1a hash. Stable across processes and builds
inline uint64_t fnv1a64(const std::string& s) noexcept {
    uint64_t h = 14695981039346656037ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

/// @brief Fixed-width lower-case hex rendering of a 64-bit value
inline std::string toHex(uint64_t v) {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(v));
    return std::string(buf);
}

/// @brief True when every character is a letter, digit, '-' or '_' and s is non-empty
/// @details Used for tenant identifiers before they become path components.
inline bool isSafeIdentifier(const std::string& s) {
    if (s.empty())
        return false;
    for (unsigned char c : s) {
        if (!(std::isalnum(c) || c == '-' || c == '_'))
            return false;
    }
    return true;
}

/// @brief True if s begins with prefix
inline bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace DocStore::util
