#ifndef WORDBASE_TIME_UTILS_HPP
#define WORDBASE_TIME_UTILS_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace wordbase {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

int64_t toUnixSeconds(TimePoint tp);
TimePoint fromUnixSeconds(int64_t seconds);

// "YYYY-MM-DD HH:MM:SS.ffffff+00" with microseconds, suitable as a TIMESTAMPTZ parameter
std::string formatTimestamp(TimePoint tp);

// "YYYY-MM-DDTHH:MM:SSZ"
std::string formatIsoTimestamp(TimePoint tp);

/**
 * Normalizes a calendar date to "YYYY-MM-DD".
 * Tries, in order: DD-MM-YYYY, YYYY-MM-DD, DD/MM/YYYY, MM/DD/YYYY,
 * DD.MM.YYYY, YYYY.MM.DD. Returns nothing if no format matches or the
 * date does not exist.
 */
std::optional<std::string> normalizeDate(const std::string& value);

/**
 * Parses an ISO 8601 timestamp: date, optional 'T' or ' ' separated time,
 * optional fraction and optional 'Z' or +HH[:MM] offset. Values without an
 * offset are taken as UTC.
 */
std::optional<TimePoint> parseIsoTimestamp(const std::string& value);

} // namespace wordbase

#endif // WORDBASE_TIME_UTILS_HPP
