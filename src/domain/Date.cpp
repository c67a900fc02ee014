/**
 * @file Date.cpp
 * @brief Implementation of Date using the civil-from-days algorithms.
 */

#include "domain/Date.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace kelvin::domain {

namespace {

struct Civil {
    std::int64_t year;
    unsigned month;
    unsigned day;
};

bool IsLeapYear(std::int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned DaysInMonth(std::int64_t y, unsigned m) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && IsLeapYear(y)) return 29;
    return kDays[m - 1];
}

// Era-based conversion, valid for the whole proleptic Gregorian calendar.
std::int64_t DaysFromCivil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

Civil CivilFromDays(std::int64_t z) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return Civil{m <= 2 ? y + 1 : y, m, d};
}

const std::int64_t kMinDays = DaysFromCivil(Date::kMinYear, 1, 1);
const std::int64_t kMaxDays = DaysFromCivil(Date::kMaxYear, 12, 31);

int ParseDigits(const std::string& text, size_t pos, size_t count) {
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        value = value * 10 + (text[i] - '0');
    }
    return value;
}

} // namespace

std::optional<Date> Date::FromYmd(int year, unsigned month, unsigned day) {
    if (year < kMinYear || year > kMaxYear) return std::nullopt;
    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > DaysInMonth(year, month)) return std::nullopt;
    return Date(DaysFromCivil(year, month, day));
}

std::optional<Date> Date::Parse(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    for (size_t i = 0; i < text.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return std::nullopt;
        }
    }
    return FromYmd(ParseDigits(text, 0, 4),
                   static_cast<unsigned>(ParseDigits(text, 5, 2)),
                   static_cast<unsigned>(ParseDigits(text, 8, 2)));
}

Date Date::Today() {
    std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return Date(DaysFromCivil(tm.tm_year + 1900,
                              static_cast<unsigned>(tm.tm_mon + 1),
                              static_cast<unsigned>(tm.tm_mday)));
}

int Date::year() const {
    return static_cast<int>(CivilFromDays(m_days).year);
}

unsigned Date::month() const {
    return CivilFromDays(m_days).month;
}

unsigned Date::day() const {
    return CivilFromDays(m_days).day;
}

std::optional<Date> Date::addDays(std::int64_t days) const {
    // m_days + days may overflow; check against the bounds first.
    if (days > 0 && days > kMaxDays - m_days) return std::nullopt;
    if (days < 0 && days < kMinDays - m_days) return std::nullopt;
    return Date(m_days + days);
}

std::string Date::toString() const {
    Civil c = CivilFromDays(m_days);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(c.year), c.month, c.day);
    return buf;
}

} // namespace kelvin::domain
