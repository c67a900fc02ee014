/**
 * @file TaskPrinter.hpp
 * @brief Renders tasks as a table or a detail view.
 */

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "domain/Task.hpp"
#include "ui/TerminalStyle.hpp"

namespace kelvin::ui {

/**
 * @brief Columns: ID, Task, State, Thaw Date, Due Date. Prints "No tasks found." when empty.
 */
void PrintTaskTable(std::ostream& out, const std::vector<domain::Task>& tasks, const TerminalStyle& style);

/**
 * @brief One labelled line per field; Description only when non-empty.
 */
void PrintTaskDetails(std::ostream& out, const domain::Task& task, const TerminalStyle& style);

/**
 * @brief "-" for an absent date.
 */
std::string FormatDate(const std::optional<domain::Date>& date);

} // namespace kelvin::ui
