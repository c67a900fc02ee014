/**
 * @file DateResolver.hpp
 * @brief Turns a user date specification ("3d", "2w", "2026-03-01") into a Date.
 */

#pragma once

#include <string>

#include "domain/Date.hpp"

namespace kelvin::domain {

/**
 * @brief Resolves a relative or absolute date specification.
 *
 * "<digits>d" adds days and "<digits>w" adds weeks to @p reference.
 * Anything else must be exactly "YYYY-MM-DD".
 *
 * @throws InvalidDateSpec on a malformed spec or when the result leaves the calendar range.
 */
Date ResolveDateSpec(const std::string& spec, const Date& reference);

} // namespace kelvin::domain
