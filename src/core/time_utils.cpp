#include <omc/core/time_utils.h>

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace omc::core {

namespace {

bool parseDigits(std::string_view text, size_t pos, size_t count, int& out) {
    if (pos + count > text.size())
        return false;
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        char c = text[i];
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

} // namespace

std::string formatTimestamp(TimePoint tp) {
    auto time_t_now = std::chrono::system_clock::to_time_t(tp);
    auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count() %
        1000000;
    if (micros < 0)
        micros += 1000000;

    std::tm tm_utc;
    gmtime_r(&time_t_now, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(6)
        << micros << 'Z';
    return oss.str();
}

std::string nowTimestamp() {
    return formatTimestamp(std::chrono::system_clock::now());
}

std::optional<TimePoint> parseTimestamp(std::string_view text) {
    // YYYY-MM-DDTHH:MM:SS
    int year, month, day, hour, minute, second;
    if (text.size() < 19 || !parseDigits(text, 0, 4, year) || text[4] != '-' ||
        !parseDigits(text, 5, 2, month) || text[7] != '-' || !parseDigits(text, 8, 2, day) ||
        (text[10] != 'T' && text[10] != 't' && text[10] != ' ') ||
        !parseDigits(text, 11, 2, hour) || text[13] != ':' || !parseDigits(text, 14, 2, minute) ||
        text[16] != ':' || !parseDigits(text, 17, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
        second > 60) {
        return std::nullopt;
    }

    size_t pos = 19;
    int64_t micros = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int64_t scale = 100000;
        size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) {
                micros += (text[pos] - '0') * scale;
                scale /= 10;
            }
            ++digits;
            ++pos;
        }
        if (digits == 0)
            return std::nullopt;
    }

    int offsetSeconds = 0;
    if (pos < text.size()) {
        char tz = text[pos];
        if (tz == 'Z' || tz == 'z') {
            ++pos;
        } else if (tz == '+' || tz == '-') {
            int oh, om;
            if (!parseDigits(text, pos + 1, 2, oh) || pos + 3 >= text.size() ||
                text[pos + 3] != ':' || !parseDigits(text, pos + 4, 2, om)) {
                return std::nullopt;
            }
            offsetSeconds = (oh * 3600 + om * 60) * (tz == '+' ? 1 : -1);
            pos += 6;
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size())
        return std::nullopt;

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t utc = timegm(&tm);
    if (utc == static_cast<std::time_t>(-1))
        return std::nullopt;

    auto tp = std::chrono::system_clock::from_time_t(utc - offsetSeconds);
    return tp + std::chrono::microseconds(micros);
}

double daysBetween(TimePoint then, TimePoint now) {
    auto secs = std::chrono::duration_cast<std::chrono::duration<double>>(now - then).count();
    return secs / 86400.0;
}

} // namespace omc::core
