/**
 * @file DateResolver.cpp
 * @brief Implementation of ResolveDateSpec.
 */

#include "domain/DateResolver.hpp"

#include <cctype>
#include <cstdint>
#include <limits>
#include <optional>

#include "domain/Errors.hpp"

namespace kelvin::domain {

namespace {

std::optional<std::int64_t> ParseCount(const std::string& digits) {
    if (digits.empty()) return std::nullopt;
    constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
    std::int64_t value = 0;
    for (char ch : digits) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) return std::nullopt;
        int digit = ch - '0';
        if (value > (kMax - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

Date AddOffset(const std::string& spec, const Date& reference, std::int64_t days) {
    auto result = reference.addDays(days);
    if (!result) {
        throw InvalidDateSpec("Date overflow: '" + spec + "' from " + reference.toString());
    }
    return *result;
}

} // namespace

Date ResolveDateSpec(const std::string& spec, const Date& reference) {
    if (!spec.empty() && (spec.back() == 'd' || spec.back() == 'w')) {
        const char unit = spec.back();
        auto count = ParseCount(spec.substr(0, spec.size() - 1));
        if (!count) {
            throw InvalidDateSpec("Invalid relative date format: " + spec);
        }
        if (unit == 'd') {
            return AddOffset(spec, reference, *count);
        }
        if (*count > std::numeric_limits<std::int64_t>::max() / 7) {
            throw InvalidDateSpec("Date overflow: '" + spec + "' from " + reference.toString());
        }
        return AddOffset(spec, reference, *count * 7);
    }

    auto absolute = Date::Parse(spec);
    if (!absolute) {
        throw InvalidDateSpec("Invalid date format '" + spec + "': expected Nd, Nw or YYYY-MM-DD");
    }
    return *absolute;
}

} // namespace kelvin::domain
