/**
 * @file TaskPrinter.cpp
 * @brief Implementation of the task table and detail renderers.
 */

#include "ui/TaskPrinter.hpp"

#include <algorithm>

namespace kelvin::ui {

namespace {

constexpr size_t kIdWidth = 5;
constexpr size_t kStateWidth = 11;  // "Thawing" plus margin
constexpr size_t kDateWidth = 12;   // "YYYY-MM-DD" plus margin
constexpr size_t kLabelWidth = 14;

std::string PadRight(const std::string& text, size_t width) {
    if (text.size() >= width) return text;
    return text + std::string(width - text.size(), ' ');
}

// Header cells are padded before styling so escapes don't skew the columns.
std::string Header(const std::string& text, size_t width, const TerminalStyle& style) {
    return style.bold(PadRight(text, width));
}

void PrintField(std::ostream& out, const std::string& label, const std::string& value, const TerminalStyle& style) {
    out << style.bold(PadRight(label, kLabelWidth)) << " " << value << "\n";
}

} // namespace

std::string FormatDate(const std::optional<domain::Date>& date) {
    return date ? date->toString() : "-";
}

void PrintTaskTable(std::ostream& out, const std::vector<domain::Task>& tasks, const TerminalStyle& style) {
    if (tasks.empty()) {
        out << "No tasks found." << std::endl;
        return;
    }

    size_t taskWidth = 4; // "Task"
    for (const auto& task : tasks) {
        taskWidth = std::max(taskWidth, task.title.size());
    }

    out << Header("ID", kIdWidth, style) << "  "
        << Header("Task", taskWidth, style) << "  "
        << Header("State", kStateWidth, style) << "  "
        << Header("Thaw Date", kDateWidth, style) << "  "
        << style.bold("Due Date") << "\n";

    const size_t totalWidth = kIdWidth + 2 + taskWidth + 2 + kStateWidth + 2 + kDateWidth + 2 + kDateWidth;
    std::string rule;
    for (size_t i = 0; i < totalWidth; ++i) {
        rule += "─";
    }
    out << rule << "\n";

    for (const auto& task : tasks) {
        out << PadRight(std::to_string(task.id), kIdWidth) << "  "
            << PadRight(task.title, taskWidth) << "  "
            << style.statePadded(task.state, kStateWidth) << "  "
            << PadRight(FormatDate(task.thawDate), kDateWidth) << "  "
            << FormatDate(task.dueDate) << "\n";
    }
    out.flush();
}

void PrintTaskDetails(std::ostream& out, const domain::Task& task, const TerminalStyle& style) {
    PrintField(out, "ID:", std::to_string(task.id), style);
    PrintField(out, "Title:", task.title, style);
    if (!task.description.empty()) {
        PrintField(out, "Description:", task.description, style);
    }
    PrintField(out, "State:", style.state(task.state), style);
    PrintField(out, "Thaw Date:", FormatDate(task.thawDate), style);
    PrintField(out, "Due Date:", FormatDate(task.dueDate), style);
    PrintField(out, "Created:", task.createdAt.toString(), style);
    out.flush();
}

} // namespace kelvin::ui
