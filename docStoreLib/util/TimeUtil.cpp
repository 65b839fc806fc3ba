#include <docstore/util/TimeUtil.hpp>

#include <cctype>
#include <cstdio>
#include <ctime>

namespace DocStore::util {

namespace {

bool readDigits(const std::string& s, size_t& pos, size_t count, int& out) {
    if (pos + count > s.size())
        return false;
    int v = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
        v = v * 10 + (c - '0');
    }
    pos += count;
    out = v;
    return true;
}

bool expect(const std::string& s, size_t& pos, char c) {
    if (pos >= s.size() || s[pos] != c)
        return false;
    ++pos;
    return true;
}

} // namespace

std::string formatTimestamp(Clock::time_point tp) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    if (secs > tp)
        secs -= std::chrono::seconds(1);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();

    std::time_t t = Clock::to_time_t(secs);
    std::tm tm{};
    ::gmtime_r(&t, &tm);

    char buf[48];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld+00:00",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<long long>(micros));
    return std::string(buf);
}

std::string nowTimestamp() { return formatTimestamp(Clock::now()); }

std::string compactStamp(Clock::time_point tp) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    ::gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
    return std::string(buf);
}

bool parseTimestamp(const std::string& text, Clock::time_point& out) {
    size_t pos = 0;
    std::tm tm{};
    int year = 0, month = 0, day = 0;
    if (!readDigits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !readDigits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !readDigits(text, pos, 2, day))
        return false;
    if (month < 1 || month > 12 || day < 1 || day > 31)
        return false;

    int hour = 0, minute = 0, second = 0;
    long long micros = 0;
    long offsetSeconds = 0;

    if (pos < text.size()) {
        if (text[pos] != 'T' && text[pos] != ' ')
            return false;
        ++pos;
        if (!readDigits(text, pos, 2, hour) || !expect(text, pos, ':') ||
            !readDigits(text, pos, 2, minute))
            return false;
        if (pos < text.size() && text[pos] == ':') {
            ++pos;
            if (!readDigits(text, pos, 2, second))
                return false;
            if (pos < text.size() && text[pos] == '.') {
                ++pos;
                size_t digits = 0;
                while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                    // 마이크로초 이하 자릿수는 버린다.
                    if (digits < 6)
                        micros = micros * 10 + (text[pos] - '0');
                    ++digits;
                    ++pos;
                }
                if (digits == 0)
                    return false;
                for (size_t i = digits; i < 6; ++i)
                    micros *= 10;
            }
        }
        if (hour > 23 || minute > 59 || second > 60)
            return false;

        if (pos < text.size()) {
            char c = text[pos];
            if (c == 'Z' || c == 'z') {
                ++pos;
            } else if (c == '+' || c == '-') {
                ++pos;
                int oh = 0, om = 0;
                if (!readDigits(text, pos, 2, oh))
                    return false;
                if (pos < text.size() && text[pos] == ':')
                    ++pos;
                if (!readDigits(text, pos, 2, om))
                    return false;
                offsetSeconds = (oh * 3600L + om * 60L) * (c == '+' ? 1 : -1);
            } else {
                return false;
            }
        }
        if (pos != text.size())
            return false;
    }

    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t t = ::timegm(&tm);
    if (t == static_cast<std::time_t>(-1) && year != 1969)
        return false;

    out = Clock::from_time_t(t - offsetSeconds) +
          std::chrono::duration_cast<Clock::duration>(std::chrono::microseconds(micros));
    return true;
}

long daysBetween(Clock::time_point then, Clock::time_point now) {
    if (then >= now)
        return 0;
    auto hours = std::chrono::duration_cast<std::chrono::hours>(now - then).count();
    return static_cast<long>(hours / 24);
}

} // namespace DocStore::util
