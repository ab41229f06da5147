/// @file time_utils.cpp
/// @brief UTC calendar helpers built on the C++20 chrono calendar types.

#include "fxp/foundation/time_utils.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>

namespace fxp::foundation {

bool readDigits(std::string_view text, std::size_t pos, std::size_t width, unsigned& out) {
    if (pos + width > text.size()) {
        return false;
    }
    unsigned value = 0;
    for (std::size_t i = pos; i < pos + width; ++i) {
        auto c = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(c)) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

bool readClockTime(std::string_view text, std::size_t pos, unsigned& hour, unsigned& minute,
                   unsigned& second) {
    return pos + 8 <= text.size() && readDigits(text, pos, 2, hour) && text[pos + 2] == ':' &&
           readDigits(text, pos + 3, 2, minute) && text[pos + 5] == ':' &&
           readDigits(text, pos + 6, 2, second);
}

std::optional<Timestamp> makeUtc(int year, unsigned month, unsigned day,
                                 unsigned hour, unsigned minute, unsigned second) {
    using namespace std::chrono;
    year_month_day ymd{std::chrono::year{year}, std::chrono::month{month},
                       std::chrono::day{day}};
    if (!ymd.ok() || hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }
    return sys_days{ymd} + hours{hour} + minutes{minute} + seconds{second};
}

std::string formatIso8601(Timestamp ts) {
    using namespace std::chrono;
    auto dp = floor<days>(ts);
    year_month_day ymd{dp};
    hh_mm_ss hms{floor<seconds>(ts - dp)};

    char buf[48];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02dZ",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()),
                  static_cast<int>(hms.hours().count()),
                  static_cast<int>(hms.minutes().count()),
                  static_cast<int>(hms.seconds().count()));
    return buf;
}

std::string formatDate(Timestamp ts) {
    using namespace std::chrono;
    year_month_day ymd{floor<days>(ts)};

    char buf[24];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()));
    return buf;
}

std::optional<Timestamp> parseIso8601(std::string_view text) {
    // YYYY-MM-DDTHH:MM:SS[Z]
    if (text.size() != 19 && !(text.size() == 20 && text.back() == 'Z')) {
        return std::nullopt;
    }
    unsigned y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    if (!readDigits(text, 0, 4, y) || text[4] != '-' ||
        !readDigits(text, 5, 2, mo) || text[7] != '-' ||
        !readDigits(text, 8, 2, d) || text[10] != 'T' ||
        !readClockTime(text, 11, h, mi, s)) {
        return std::nullopt;
    }
    return makeUtc(static_cast<int>(y), mo, d, h, mi, s);
}

Timestamp utcMidnight(Timestamp ts) {
    return std::chrono::floor<std::chrono::days>(ts);
}

Timestamp floorToDayCycle(Timestamp ts, int days) {
    using namespace std::chrono;
    auto dayCount = floor<std::chrono::days>(ts).time_since_epoch().count();
    auto cycle = static_cast<decltype(dayCount)>(days > 0 ? days : 1);
    auto floored = dayCount - (((dayCount % cycle) + cycle) % cycle);
    return sys_days{std::chrono::days{floored}};
}

} // namespace fxp::foundation
