/**
 * @file Lifecycle.hpp
 * @brief The task lifecycle state machine.
 *
 * | Operation        | Valid from       | Result | Side effect       |
 * |------------------|------------------|--------|-------------------|
 * | Activate (warm)  | Thawing, Frozen  | Active | clears thaw date  |
 * | Complete (burn)  | Active, Frozen   | Done   | none              |
 * | Reopen (cool)    | Done             | Active | clears thaw date  |
 * | Defer (freeze)   | any              | Frozen | sets thaw date    |
 *
 * Thawing is only ever entered through SweepThawed (see ThawScanner.hpp).
 */

#pragma once

#include <string>

#include "domain/Date.hpp"
#include "domain/Task.hpp"

namespace kelvin::domain {

enum class LifecycleOperation {
    Activate,
    Complete,
    Reopen,
    Defer
};

/**
 * @brief Verb used on the command line ("warm", "burn", "cool", "freeze").
 */
std::string OperationToString(LifecycleOperation op);

/**
 * @brief True if @p op may be applied to a task in @p state.
 */
bool CanApply(LifecycleOperation op, TaskState state);

/**
 * @brief Thawing/Frozen -> Active. Clears the thaw date.
 * @throws InvalidTransition from Active or Done; the task is left untouched.
 */
void Activate(Task& task);

/**
 * @brief Active/Frozen -> Done.
 * @throws InvalidTransition from Thawing or Done.
 */
void Complete(Task& task);

/**
 * @brief Done -> Active. Clears the thaw date.
 * @throws InvalidTransition from any other state.
 */
void Reopen(Task& task);

/**
 * @brief Any state -> Frozen until @p thawDate.
 */
void Defer(Task& task, const Date& thawDate);

} // namespace kelvin::domain
