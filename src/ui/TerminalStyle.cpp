#include "ui/TerminalStyle.hpp"

#include <cstdlib>
#include <unistd.h>

namespace kelvin::ui {

TerminalStyle TerminalStyle::ForStdout() {
    const char* noColor = std::getenv("NO_COLOR");
    if (noColor && *noColor) {
        return TerminalStyle(false);
    }
    return TerminalStyle(isatty(STDOUT_FILENO) != 0);
}

std::string TerminalStyle::bold(const std::string& text) const {
    if (!m_enabled) return text;
    return "\033[1m" + text + "\033[0m";
}

std::string TerminalStyle::rgb(const std::string& text, int r, int g, int b) const {
    if (!m_enabled) return text;
    return "\033[38;2;" + std::to_string(r) + ";" + std::to_string(g) + ";" + std::to_string(b) + "m" +
           text + "\033[0m";
}

std::string TerminalStyle::state(domain::TaskState state) const {
    const std::string label = domain::StateToString(state);
    switch (state) {
        case domain::TaskState::Frozen: return rgb(label, 0xBB, 0xE8, 0xF2);
        case domain::TaskState::Thawing: return rgb(label, 0x94, 0xD7, 0xF2);
        case domain::TaskState::Active: return rgb(label, 0x55, 0xB3, 0xD9);
        case domain::TaskState::Done: return rgb(label, 0x3F, 0x5F, 0x73);
    }
    return label;
}

std::string TerminalStyle::statePadded(domain::TaskState state, size_t width) const {
    const size_t visible = domain::StateToString(state).size();
    const size_t padding = width > visible ? width - visible : 0;
    return this->state(state) + std::string(padding, ' ');
}

} // namespace kelvin::ui
