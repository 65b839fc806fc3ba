#pragma once
/// @file TimeUtil.hpp
/// @brief UTC timestamp formatting and parsing for record audit fields

#include <chrono>
#include <string>

namespace DocStore::util {

using Clock = std::chrono::system_clock;

/// @brief Formats a time point as `YYYY-MM-DDTHH:MM:SS.ffffff+00:00` (UTC)
std::string formatTimestamp(Clock::time_point tp);

/// @brief Current time in the record timestamp format
std::string nowTimestamp();

/// @brief Compact UTC stamp `YYYYmmdd_HHMMSS`, used for backup directory names
std::string compactStamp(Clock::time_point tp);

/// @brief Parses an ISO-8601 timestamp
/// @details Accepts `YYYY-MM-DD`, optionally followed by `T` or a space,
///          `HH:MM[:SS[.fraction]]` and a `Z` or `+HH:MM`/`-HH:MM` offset.
///          A missing offset is read as UTC.
/// @param text Input text
/// @param out Parsed time point
/// @return false if the text is not a timestamp
bool parseTimestamp(const std::string& text, Clock::time_point& out);

/// @brief Whole days elapsed from `then` to `now` (floor, never negative)
long daysBetween(Clock::time_point then, Clock::time_point now);

} // namespace DocStore::util
