#pragma once
/// @file Version.hpp
/// @brief Dotted version string ordering ("1.4" < "1.10")

#include <cctype>
#include <string>
#include <vector>

namespace DocStore {

/// @brief Longest digit group accepted in one version component
constexpr size_t kMaxVersionComponentDigits = 9;

namespace detail {

// 자릿수 제한을 넘는 구성요소는 이 값으로 고정된다 (어떤 유효한 구성요소보다 크다).
constexpr long kVersionComponentOverflow = 1000000000L;

// "1.4.2" -> {1, 4, 2}. 각 구성요소의 앞쪽 숫자만 읽고 나머지 문자는 무시한다.
inline std::vector<long> versionParts(const std::string& v) {
    std::vector<long> parts;
    size_t i = 0;
    while (i <= v.size()) {
        size_t dot = v.find('.', i);
        if (dot == std::string::npos)
            dot = v.size();
        long n = 0;
        size_t digits = 0;
        for (size_t k = i; k < dot && std::isdigit(static_cast<unsigned char>(v[k])); ++k) {
            if (n == 0 && v[k] == '0')
                continue;
            if (++digits > kMaxVersionComponentDigits) {
                n = kVersionComponentOverflow;
                break;
            }
            n = n * 10 + (v[k] - '0');
        }
        parts.push_back(n);
        i = dot + 1;
    }
    while (!parts.empty() && parts.back() == 0)
        parts.pop_back();
    return parts;
}

} // namespace detail

/// @brief Numeric, component-wise comparison. Missing components count as 0
/// @return negative if a < b, 0 if equal, positive if a > b
inline int compareVersions(const std::string& a, const std::string& b) {
    const auto pa = detail::versionParts(a);
    const auto pb = detail::versionParts(b);
    const size_t n = pa.size() > pb.size() ? pa.size() : pb.size();
    for (size_t i = 0; i < n; ++i) {
        long x = i < pa.size() ? pa[i] : 0;
        long y = i < pb.size() ? pb[i] : 0;
        if (x != y)
            return x < y ? -1 : 1;
    }
    return 0;
}

/// @brief True for non-empty strings of digit groups separated by single dots
/// @details Each group holds at most kMaxVersionComponentDigits digits.
inline bool isVersionString(const std::string& v) {
    if (v.empty() || v.front() == '.' || v.back() == '.')
        return false;
    char prev = '\0';
    size_t groupLength = 0;
    for (char c : v) {
        if (c == '.') {
            if (prev == '.')
                return false;
            groupLength = 0;
        } else if (!std::isdigit(static_cast<unsigned char>(c)) || ++groupLength > kMaxVersionComponentDigits) {
            return false;
        }
        prev = c;
    }
    return true;
}

} // namespace DocStore
