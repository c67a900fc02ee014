/**
 * @file Task.hpp
 * @brief Domain entity representing a single tracked task.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "domain/Date.hpp"
#include "domain/TaskState.hpp"

namespace kelvin::domain {

/**
 * @struct Task
 * @brief A task and its position in the thermal lifecycle.
 *
 * Invariant: state == Frozen implies thawDate has a value.
 */
struct Task {
    std::uint32_t id = 0;                 ///< Unique, never reused.
    std::string title;                    ///< Non-empty display string.
    std::string description;              ///< Empty when absent.
    TaskState state = TaskState::Active;
    std::optional<Date> thawDate;         ///< Only meaningful while Frozen or Thawing.
    std::optional<Date> dueDate;          ///< Informational only.
    Date createdAt;                       ///< Set once at creation.

    Task(std::uint32_t taskId, std::string taskTitle, Date created)
        : id(taskId), title(std::move(taskTitle)), createdAt(created) {}
};

} // namespace kelvin::domain
