#include "domain/ThawScanner.hpp"

namespace kelvin::domain {

std::size_t SweepThawed(std::vector<Task>& tasks, const Date& today) {
    std::size_t count = 0;
    for (auto& task : tasks) {
        if (task.state == TaskState::Frozen && task.thawDate && today >= *task.thawDate) {
            task.state = TaskState::Thawing;
            ++count;
        }
    }
    return count;
}

} // namespace kelvin::domain
