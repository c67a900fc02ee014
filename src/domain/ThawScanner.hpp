/**
 * @file ThawScanner.hpp
 * @brief Time-triggered promotion of Frozen tasks whose thaw date has arrived.
 */

#pragma once

#include <cstddef>
#include <vector>

#include "domain/Date.hpp"
#include "domain/Task.hpp"

namespace kelvin::domain {

/**
 * @brief Moves every Frozen task with thawDate <= @p today to Thawing.
 *
 * The thaw date stays populated. Idempotent for a given day; every other
 * task is left as is.
 *
 * @return Number of tasks that changed.
 */
std::size_t SweepThawed(std::vector<Task>& tasks, const Date& today);

} // namespace kelvin::domain
