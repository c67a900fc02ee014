/**
 * @file Date.hpp
 * @brief Value Object for a proleptic-Gregorian calendar date.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace kelvin::domain {

/**
 * @class Date
 * @brief A calendar day without time zone, stored as days since 1970-01-01.
 *
 * Invariant: always within [0001-01-01, 9999-12-31].
 */
class Date {
public:
    static constexpr int kMinYear = 1;
    static constexpr int kMaxYear = 9999;

    /**
     * @brief Builds a date from its components.
     * @return std::nullopt if the components do not name a real day in range.
     */
    static std::optional<Date> FromYmd(int year, unsigned month, unsigned day);

    /**
     * @brief Parses exactly "YYYY-MM-DD".
     * @return std::nullopt on any other shape or on an impossible day.
     */
    static std::optional<Date> Parse(const std::string& text);

    /** @brief The local calendar date of this machine. */
    static Date Today();

    int year() const;
    unsigned month() const;
    unsigned day() const;

    /**
     * @brief Checked day arithmetic.
     * @return std::nullopt if the result leaves the representable range.
     */
    std::optional<Date> addDays(std::int64_t days) const;

    /** @brief Formats as "YYYY-MM-DD". */
    std::string toString() const;

    std::int64_t daysSinceEpoch() const { return m_days; }

    bool operator==(const Date& other) const { return m_days == other.m_days; }
    bool operator!=(const Date& other) const { return m_days != other.m_days; }
    bool operator<(const Date& other) const { return m_days < other.m_days; }
    bool operator<=(const Date& other) const { return m_days <= other.m_days; }
    bool operator>(const Date& other) const { return m_days > other.m_days; }
    bool operator>=(const Date& other) const { return m_days >= other.m_days; }

private:
    explicit Date(std::int64_t days) : m_days(days) {}

    std::int64_t m_days; ///< Days since 1970-01-01.
};

} // namespace kelvin::domain
