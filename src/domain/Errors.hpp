/**
 * @file Errors.hpp
 * @brief Exception taxonomy shared by the domain, application and infrastructure layers.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace kelvin::domain {

/**
 * @brief A date specification that is malformed or lands outside the calendar range.
 */
class InvalidDateSpec : public std::invalid_argument {
public:
    explicit InvalidDateSpec(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * @brief A lifecycle operation attempted from a state that does not allow it.
 */
class InvalidTransition : public std::logic_error {
public:
    InvalidTransition(std::uint32_t taskId, std::string state, std::string operation, const std::string& message)
        : std::logic_error(message), m_taskId(taskId), m_state(std::move(state)), m_operation(std::move(operation)) {}

    std::uint32_t taskId() const { return m_taskId; }
    const std::string& state() const { return m_state; }
    const std::string& operation() const { return m_operation; }

private:
    std::uint32_t m_taskId;
    std::string m_state;
    std::string m_operation;
};

class TaskNotFound : public std::runtime_error {
public:
    explicit TaskNotFound(std::uint32_t taskId)
        : std::runtime_error("Task " + std::to_string(taskId) + " not found"), m_taskId(taskId) {}

    std::uint32_t taskId() const { return m_taskId; }

private:
    std::uint32_t m_taskId;
};

/**
 * @brief Read, parse or write failure on the task file. The message always names the path.
 */
class StorageError : public std::runtime_error {
public:
    StorageError(std::string path, const std::string& message)
        : std::runtime_error(message), m_path(std::move(path)) {}

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

class ConfigError : public std::runtime_error {
public:
    ConfigError(std::string path, const std::string& message)
        : std::runtime_error(message), m_path(std::move(path)) {}

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

} // namespace kelvin::domain
