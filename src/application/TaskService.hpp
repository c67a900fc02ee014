/**
 * @file TaskService.hpp
 * @brief Application Service running each command against the task collection.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "domain/Date.hpp"
#include "domain/Task.hpp"
#include "domain/TaskRepository.hpp"

namespace kelvin::application {

struct AddTaskRequest {
    std::string title;
    std::optional<std::string> description;
    std::optional<std::string> thawSpec;  ///< If set, the task starts Frozen.
    std::optional<std::string> dueSpec;
};

struct EditTaskRequest {
    std::uint32_t id = 0;
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::string> thawSpec;
    std::optional<std::string> dueSpec;
};

enum class ListFilter {
    Open,    ///< Thawing and Active.
    Frozen,  ///< Frozen only.
    All
};

/**
 * @class TaskService
 * @brief One method per command.
 *
 * Every method loads the collection, runs the thaw sweep for @p today,
 * applies its change and saves. A method that throws saves nothing.
 * Nothing is cached between calls.
 */
class TaskService {
public:
    TaskService(std::shared_ptr<domain::TaskRepository> repository, int defaultDeferDays);

    // Creates a task; Frozen if a thaw spec is given, Active otherwise.
    domain::Task addTask(const AddTaskRequest& request, const domain::Date& today);

    // Updates only the fields present in the request. State is not changed.
    domain::Task editTask(const EditTaskRequest& request, const domain::Date& today);

    domain::Task showTask(std::uint32_t id, const domain::Date& today);

    // Saves only if the sweep changed something.
    std::vector<domain::Task> listTasks(ListFilter filter, const domain::Date& today);

    domain::Task warmTask(std::uint32_t id, const domain::Date& today);
    domain::Task burnTask(std::uint32_t id, const domain::Date& today);
    domain::Task coolTask(std::uint32_t id, const domain::Date& today);

    // Without a spec the task thaws after the configured default period.
    domain::Task freezeTask(std::uint32_t id, const std::optional<std::string>& thawSpec, const domain::Date& today);

private:
    std::vector<domain::Task> loadSwept(const domain::Date& today, std::size_t* thawed = nullptr);
    domain::Task mutateTask(std::uint32_t id, const domain::Date& today,
                            const std::function<void(domain::Task&)>& mutation);

    std::shared_ptr<domain::TaskRepository> m_repository;
    int m_defaultDeferDays;
};

} // namespace kelvin::application
