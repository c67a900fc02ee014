/**
 * @file TaskRepository.hpp
 * @brief Interface for persistence of the task collection.
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "domain/Task.hpp"

namespace kelvin::domain {

/**
 * @class TaskRepository
 * @brief Whole-collection load/save. The backing store is the only source of truth.
 */
class TaskRepository {
public:
    virtual ~TaskRepository() = default;

    /** @brief Loads every task in insertion order. Empty if nothing is stored yet. */
    virtual std::vector<Task> load() = 0;

    /** @brief Replaces the stored collection with @p tasks. */
    virtual void save(const std::vector<Task>& tasks) = 0;

    /**
     * @brief Highest id in @p tasks plus one, or 1 for an empty collection.
     * @throws std::overflow_error once the id space is exhausted.
     */
    static std::uint32_t nextId(const std::vector<Task>& tasks) {
        std::uint32_t maxId = 0;
        for (const auto& task : tasks) {
            maxId = std::max(maxId, task.id);
        }
        if (maxId == std::numeric_limits<std::uint32_t>::max()) {
            throw std::overflow_error("No task ids left: highest id is " + std::to_string(maxId));
        }
        return maxId + 1;
    }
};

} // namespace kelvin::domain
