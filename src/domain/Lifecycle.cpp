/**
 * @file Lifecycle.cpp
 * @brief Implementation of the lifecycle transitions.
 */

#include "domain/Lifecycle.hpp"

#include "domain/Errors.hpp"

namespace kelvin::domain {

namespace {

std::string AllowedSources(LifecycleOperation op) {
    switch (op) {
        case LifecycleOperation::Activate: return "Only Frozen or Thawing tasks can be warmed.";
        case LifecycleOperation::Complete: return "Only Active or Frozen tasks can be burned.";
        case LifecycleOperation::Reopen: return "Only Done tasks can be cooled.";
        case LifecycleOperation::Defer: return "Any task can be frozen.";
    }
    return "";
}

void RequireTransition(const Task& task, LifecycleOperation op) {
    if (CanApply(op, task.state)) return;

    const std::string verb = OperationToString(op);
    const std::string state = StateToString(task.state);
    throw InvalidTransition(task.id, state, verb,
        "Cannot " + verb + " task " + std::to_string(task.id) +
        " (state: " + state + "). " + AllowedSources(op));
}

} // namespace

std::string OperationToString(LifecycleOperation op) {
    switch (op) {
        case LifecycleOperation::Activate: return "warm";
        case LifecycleOperation::Complete: return "burn";
        case LifecycleOperation::Reopen: return "cool";
        case LifecycleOperation::Defer: return "freeze";
    }
    return "unknown";
}

bool CanApply(LifecycleOperation op, TaskState state) {
    switch (op) {
        case LifecycleOperation::Activate:
            switch (state) {
                case TaskState::Frozen:
                case TaskState::Thawing:
                    return true;
                case TaskState::Active:
                case TaskState::Done:
                    return false;
            }
            return false;
        case LifecycleOperation::Complete:
            switch (state) {
                case TaskState::Frozen:
                case TaskState::Active:
                    return true;
                case TaskState::Thawing:
                case TaskState::Done:
                    return false;
            }
            return false;
        case LifecycleOperation::Reopen:
            switch (state) {
                case TaskState::Done:
                    return true;
                case TaskState::Frozen:
                case TaskState::Thawing:
                case TaskState::Active:
                    return false;
            }
            return false;
        case LifecycleOperation::Defer:
            return true;
    }
    return false;
}

void Activate(Task& task) {
    RequireTransition(task, LifecycleOperation::Activate);
    task.state = TaskState::Active;
    task.thawDate.reset();
}

void Complete(Task& task) {
    RequireTransition(task, LifecycleOperation::Complete);
    task.state = TaskState::Done;
}

void Reopen(Task& task) {
    RequireTransition(task, LifecycleOperation::Reopen);
    task.state = TaskState::Active;
    task.thawDate.reset();
}

void Defer(Task& task, const Date& thawDate) {
    task.state = TaskState::Frozen;
    task.thawDate = thawDate;
}

} // namespace kelvin::domain
