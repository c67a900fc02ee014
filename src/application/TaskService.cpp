/**
 * @file TaskService.cpp
 * @brief Implementation of TaskService.
 */

#include "application/TaskService.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

#include "domain/DateResolver.hpp"
#include "domain/Errors.hpp"
#include "domain/Lifecycle.hpp"
#include "domain/ThawScanner.hpp"

namespace kelvin::application {

using domain::Date;
using domain::Task;
using domain::TaskState;

namespace {

void RequireTitle(const std::string& title) {
    if (title.empty()) {
        throw std::invalid_argument("Task title cannot be empty.");
    }
}

std::optional<Date> ResolveOptional(const std::optional<std::string>& spec, const Date& today) {
    if (!spec) return std::nullopt;
    return domain::ResolveDateSpec(*spec, today);
}

Task& FindTask(std::vector<Task>& tasks, std::uint32_t id) {
    auto it = std::find_if(tasks.begin(), tasks.end(), [id](const Task& t) { return t.id == id; });
    if (it == tasks.end()) {
        throw domain::TaskNotFound(id);
    }
    return *it;
}

bool MatchesFilter(const Task& task, ListFilter filter) {
    switch (filter) {
        case ListFilter::All:
            return true;
        case ListFilter::Frozen:
            return task.state == TaskState::Frozen;
        case ListFilter::Open:
            return task.state == TaskState::Thawing || task.state == TaskState::Active;
    }
    return false;
}

} // namespace

TaskService::TaskService(std::shared_ptr<domain::TaskRepository> repository, int defaultDeferDays)
    : m_repository(std::move(repository)), m_defaultDeferDays(defaultDeferDays) {}

std::vector<Task> TaskService::loadSwept(const Date& today, std::size_t* thawed) {
    auto tasks = m_repository->load();
    std::size_t count = domain::SweepThawed(tasks, today);
    if (thawed) *thawed = count;
    return tasks;
}

Task TaskService::mutateTask(std::uint32_t id, const Date& today,
                             const std::function<void(Task&)>& mutation) {
    auto tasks = loadSwept(today);
    Task& task = FindTask(tasks, id);
    mutation(task);
    Task result = task;
    m_repository->save(tasks);
    return result;
}

Task TaskService::addTask(const AddTaskRequest& request, const Date& today) {
    RequireTitle(request.title);
    // All specs resolve before the store is touched.
    auto thawDate = ResolveOptional(request.thawSpec, today);
    auto dueDate = ResolveOptional(request.dueSpec, today);

    auto tasks = loadSwept(today);
    Task task(domain::TaskRepository::nextId(tasks), request.title, today);
    task.description = request.description.value_or("");
    task.state = thawDate ? TaskState::Frozen : TaskState::Active;
    task.thawDate = thawDate;
    task.dueDate = dueDate;

    tasks.push_back(task);
    m_repository->save(tasks);
    return task;
}

Task TaskService::editTask(const EditTaskRequest& request, const Date& today) {
    if (request.title) RequireTitle(*request.title);
    auto thawDate = ResolveOptional(request.thawSpec, today);
    auto dueDate = ResolveOptional(request.dueSpec, today);

    return mutateTask(request.id, today, [&](Task& task) {
        if (request.title) task.title = *request.title;
        if (request.description) task.description = *request.description;
        if (thawDate) task.thawDate = thawDate;
        if (dueDate) task.dueDate = dueDate;
    });
}

Task TaskService::showTask(std::uint32_t id, const Date& today) {
    return mutateTask(id, today, [](Task&) {});
}

std::vector<Task> TaskService::listTasks(ListFilter filter, const Date& today) {
    std::size_t thawed = 0;
    auto tasks = loadSwept(today, &thawed);
    if (thawed > 0) {
        m_repository->save(tasks);
    }

    std::vector<Task> filtered;
    std::copy_if(tasks.begin(), tasks.end(), std::back_inserter(filtered),
                 [filter](const Task& t) { return MatchesFilter(t, filter); });
    return filtered;
}

Task TaskService::warmTask(std::uint32_t id, const Date& today) {
    return mutateTask(id, today, [](Task& task) { domain::Activate(task); });
}

Task TaskService::burnTask(std::uint32_t id, const Date& today) {
    return mutateTask(id, today, [](Task& task) { domain::Complete(task); });
}

Task TaskService::coolTask(std::uint32_t id, const Date& today) {
    return mutateTask(id, today, [](Task& task) { domain::Reopen(task); });
}

Task TaskService::freezeTask(std::uint32_t id, const std::optional<std::string>& thawSpec, const Date& today) {
    Date thawDate = today;
    if (thawSpec) {
        thawDate = domain::ResolveDateSpec(*thawSpec, today);
    } else {
        auto deferred = today.addDays(m_defaultDeferDays);
        if (!deferred) {
            throw domain::InvalidDateSpec("Date overflow: " + today.toString() + " + " +
                                          std::to_string(m_defaultDeferDays) + " days");
        }
        thawDate = *deferred;
    }

    return mutateTask(id, today, [&](Task& task) { domain::Defer(task, thawDate); });
}

} // namespace kelvin::application
