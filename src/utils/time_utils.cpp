#include "utils/time_utils.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace wordbase {

namespace {

bool parseExact(const std::string& value, const char* format, std::tm& out) {
    std::tm tm = {};
    std::istringstream ss(value);
    ss >> std::get_time(&tm, format);
    if (ss.fail()) {
        return false;
    }
    ss >> std::ws;
    if (!ss.eof()) {
        return false;
    }
    out = tm;
    return true;
}

// Rejects dates that timegm would silently roll over (31-02-2000 and the like)
bool isRealDate(const std::tm& tm) {
    if (tm.tm_year + 1900 < 1900 || tm.tm_year + 1900 > 9999) {
        return false;
    }
    std::tm copy = tm;
    copy.tm_hour = 12;
    copy.tm_min = 0;
    copy.tm_sec = 0;
    copy.tm_isdst = 0;
    std::time_t t = timegm(&copy);
    std::tm back = {};
    gmtime_r(&t, &back);
    return back.tm_year == tm.tm_year && back.tm_mon == tm.tm_mon && back.tm_mday == tm.tm_mday;
}

bool readDigits(const std::string& s, size_t& pos, size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int v = 0;
    for (size_t i = 0; i < count; i++) {
        char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        v = v * 10 + (c - '0');
    }
    pos += count;
    out = v;
    return true;
}

} // namespace

int64_t toUnixSeconds(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

TimePoint fromUnixSeconds(int64_t seconds) {
    return TimePoint(std::chrono::seconds(seconds));
}

std::string formatTimestamp(TimePoint tp) {
    const auto whole = std::chrono::floor<std::chrono::seconds>(tp.time_since_epoch());
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch() - whole);

    std::time_t t = static_cast<std::time_t>(whole.count());
    std::tm tm = {};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setw(6) << std::setfill('0') << micros.count() << "+00";
    return oss.str();
}

std::string formatIsoTimestamp(TimePoint tp) {
    std::time_t t = static_cast<std::time_t>(toUnixSeconds(tp));
    std::tm tm = {};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::optional<std::string> normalizeDate(const std::string& value) {
    static const char* const kFormats[] = {
        "%d-%m-%Y",  // 03-01-2002
        "%Y-%m-%d",  // 2002-01-03
        "%d/%m/%Y",  // 03/01/2002
        "%m/%d/%Y",  // 01/03/2002
        "%d.%m.%Y",  // 03.01.2002
        "%Y.%m.%d",  // 2002.01.03
    };

    for (const char* format : kFormats) {
        std::tm tm = {};
        if (!parseExact(value, format, tm) || !isRealDate(tm)) {
            continue;
        }
        std::ostringstream oss;
        oss << std::setfill('0') << std::setw(4) << (tm.tm_year + 1900) << '-'
            << std::setw(2) << (tm.tm_mon + 1) << '-'
            << std::setw(2) << tm.tm_mday;
        return oss.str();
    }
    return std::nullopt;
}

std::optional<TimePoint> parseIsoTimestamp(const std::string& value) {
    size_t pos = 0;
    int year = 0, month = 0, day = 0;
    if (!readDigits(value, pos, 4, year)) return std::nullopt;
    if (pos >= value.size() || value[pos++] != '-') return std::nullopt;
    if (!readDigits(value, pos, 2, month)) return std::nullopt;
    if (pos >= value.size() || value[pos++] != '-') return std::nullopt;
    if (!readDigits(value, pos, 2, day)) return std::nullopt;

    int hour = 0, minute = 0, second = 0;
    if (pos < value.size() && (value[pos] == 'T' || value[pos] == ' ')) {
        pos++;
        if (!readDigits(value, pos, 2, hour)) return std::nullopt;
        if (pos >= value.size() || value[pos++] != ':') return std::nullopt;
        if (!readDigits(value, pos, 2, minute)) return std::nullopt;
        if (pos < value.size() && value[pos] == ':') {
            pos++;
            if (!readDigits(value, pos, 2, second)) return std::nullopt;
        }
        if (pos < value.size() && value[pos] == '.') {
            pos++;
            size_t digits = 0;
            while (pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos]))) {
                pos++;
                digits++;
            }
            if (digits == 0) return std::nullopt;
        }
    }

    int offset_seconds = 0;
    if (pos < value.size()) {
        char c = value[pos];
        if (c == 'Z' || c == 'z') {
            pos++;
        } else if (c == '+' || c == '-') {
            const int sign = (c == '-') ? -1 : 1;
            pos++;
            int oh = 0, om = 0;
            if (!readDigits(value, pos, 2, oh)) return std::nullopt;
            if (pos < value.size() && value[pos] == ':') pos++;
            if (pos < value.size()) {
                if (!readDigits(value, pos, 2, om)) return std::nullopt;
            }
            offset_seconds = sign * (oh * 3600 + om * 60);
        }
    }
    if (pos != value.size()) return std::nullopt;
    if (month < 1 || month > 12 || hour > 23 || minute > 59 || second > 60) return std::nullopt;

    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    if (!isRealDate(tm)) return std::nullopt;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t t = timegm(&tm);
    return fromUnixSeconds(static_cast<int64_t>(t) - offset_seconds);
}

} // namespace wordbase
