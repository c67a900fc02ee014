/**
 * @file TerminalStyle.hpp
 * @brief ANSI styling for terminal output.
 */

#pragma once

#include <cstddef>
#include <string>

#include "domain/TaskState.hpp"

namespace kelvin::ui {

/**
 * @class TerminalStyle
 * @brief Wraps text in ANSI escapes, or passes it through when disabled.
 */
class TerminalStyle {
public:
    explicit TerminalStyle(bool enabled) : m_enabled(enabled) {}

    /**
     * @brief Enabled when stdout is a terminal and NO_COLOR is unset.
     */
    static TerminalStyle ForStdout();

    bool enabled() const { return m_enabled; }

    std::string bold(const std::string& text) const;

    /** @brief State label in its phase color. */
    std::string state(domain::TaskState state) const;

    /** @brief State label padded to @p width visible columns; padding sits outside the escapes. */
    std::string statePadded(domain::TaskState state, size_t width) const;

private:
    std::string rgb(const std::string& text, int r, int g, int b) const;

    bool m_enabled;
};

} // namespace kelvin::ui
