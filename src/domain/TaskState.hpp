/**
 * @file TaskState.hpp
 * @brief Value Object defining the thermal lifecycle phases of a task.
 */

#pragma once

#include <optional>
#include <string>

namespace kelvin::domain {

/**
 * @enum TaskState
 * @brief Closed set of lifecycle phases.
 *
 * Every switch over this enum omits `default`, so a new phase breaks the
 * build (-Werror=switch) until each transition handles it.
 */
enum class TaskState {
    Frozen,   ///< Deferred until its thaw date.
    Thawing,  ///< Thaw date reached, awaiting acknowledgment.
    Active,   ///< Ready to work on.
    Done      ///< Completed, can be reopened.
};

/**
 * @brief Display label ("Frozen", "Thawing", ...).
 */
inline std::string StateToString(TaskState state) {
    switch (state) {
        case TaskState::Frozen: return "Frozen";
        case TaskState::Thawing: return "Thawing";
        case TaskState::Active: return "Active";
        case TaskState::Done: return "Done";
    }
    return "Unknown";
}

/**
 * @brief Lowercase key used in the task file.
 */
inline std::string StateToKey(TaskState state) {
    switch (state) {
        case TaskState::Frozen: return "frozen";
        case TaskState::Thawing: return "thawing";
        case TaskState::Active: return "active";
        case TaskState::Done: return "done";
    }
    return "unknown";
}

inline std::optional<TaskState> StateFromKey(const std::string& key) {
    if (key == "frozen") return TaskState::Frozen;
    if (key == "thawing") return TaskState::Thawing;
    if (key == "active") return TaskState::Active;
    if (key == "done") return TaskState::Done;
    return std::nullopt;
}

} // namespace kelvin::domain
