#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "domain/Errors.hpp"
#include "domain/Lifecycle.hpp"

using namespace kelvin::domain;

namespace {

const Date kCreated = *Date::FromYmd(2026, 1, 1);
const Date kThaw = *Date::FromYmd(2026, 1, 5);
const Date kNewThaw = *Date::FromYmd(2026, 2, 1);

const std::vector<TaskState> kAllStates = {
    TaskState::Frozen, TaskState::Thawing, TaskState::Active, TaskState::Done
};

Task MakeTask(TaskState state) {
    Task task(1, "Test", kCreated);
    task.state = state;
    // Frozen and Thawing tasks carry their thaw date; others keep a stale one
    // so the clearing side effect is observable.
    task.thawDate = kThaw;
    return task;
}

void Apply(LifecycleOperation op, Task& task) {
    switch (op) {
        case LifecycleOperation::Activate: Activate(task); break;
        case LifecycleOperation::Complete: Complete(task); break;
        case LifecycleOperation::Reopen: Reopen(task); break;
        case LifecycleOperation::Defer: Defer(task, kNewThaw); break;
    }
}

struct Expected {
    bool allowed;
    TaskState result;
    std::optional<Date> thawDate;
};

Expected ExpectedOutcome(LifecycleOperation op, TaskState from) {
    switch (op) {
        case LifecycleOperation::Activate:
            if (from == TaskState::Frozen || from == TaskState::Thawing) return {true, TaskState::Active, std::nullopt};
            return {false, from, kThaw};
        case LifecycleOperation::Complete:
            if (from == TaskState::Frozen || from == TaskState::Active) return {true, TaskState::Done, kThaw};
            return {false, from, kThaw};
        case LifecycleOperation::Reopen:
            if (from == TaskState::Done) return {true, TaskState::Active, std::nullopt};
            return {false, from, kThaw};
        case LifecycleOperation::Defer:
            return {true, TaskState::Frozen, kNewThaw};
    }
    return {false, from, kThaw};
}

} // namespace

int main() {
    std::cout << "[Test] Starting Lifecycle Transition Table Test..." << std::endl;

    const std::vector<LifecycleOperation> ops = {
        LifecycleOperation::Activate, LifecycleOperation::Complete,
        LifecycleOperation::Reopen, LifecycleOperation::Defer
    };

    int checked = 0;
    for (auto op : ops) {
        for (auto from : kAllStates) {
            Task task = MakeTask(from);
            Expected expected = ExpectedOutcome(op, from);
            assert(CanApply(op, from) == expected.allowed);

            bool threw = false;
            try {
                Apply(op, task);
            } catch (const InvalidTransition& e) {
                threw = true;
                assert(e.taskId() == 1);
                assert(e.state() == StateToString(from));
                assert(e.operation() == OperationToString(op));
                const std::string message = e.what();
                assert(message.find("task 1") != std::string::npos);
                assert(message.find(StateToString(from)) != std::string::npos);
                assert(message.find(OperationToString(op)) != std::string::npos);
            }

            assert(threw == !expected.allowed);
            assert(task.state == expected.result);
            assert(task.thawDate == expected.thawDate);
            assert(task.createdAt == kCreated);
            ++checked;
        }
    }
    assert(checked == 16);

    // Frozen -> Active directly, skipping Thawing
    Task frozen = MakeTask(TaskState::Frozen);
    Activate(frozen);
    assert(frozen.state == TaskState::Active && !frozen.thawDate);

    // Done can be re-deferred ("snooze")
    Task done = MakeTask(TaskState::Done);
    done.thawDate.reset();
    Defer(done, kNewThaw);
    assert(done.state == TaskState::Frozen && done.thawDate == kNewThaw);

    assert(OperationToString(LifecycleOperation::Activate) == "warm");
    assert(OperationToString(LifecycleOperation::Complete) == "burn");
    assert(OperationToString(LifecycleOperation::Reopen) == "cool");
    assert(OperationToString(LifecycleOperation::Defer) == "freeze");

    // Storage keys
    for (auto state : kAllStates) {
        assert(StateFromKey(StateToKey(state)) == state);
    }
    assert(!StateFromKey("iced"));
    assert(StateToString(TaskState::Thawing) == "Thawing");

    std::cout << "[PASS] Lifecycle Transition Table Test (" << checked << " pairs)." << std::endl;
    return 0;
}
