/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the application configuration (config.json).
 *
 * Provides a unified way to access settings such as the default defer
 * period without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace kelvin::infrastructure {

/**
 * @struct AppConfig
 * @brief Settings read from config.json. Every field has a default.
 */
struct AppConfig {
    int thawDays = 7;                      ///< Default defer period for `freeze` without a date.
    std::optional<std::string> dataFile;   ///< Override for the task file; may start with "~".

    /**
     * @brief Resolves the task file: the override (tilde-expanded) or <configDir>/tasks.json.
     */
    std::filesystem::path dataFilePath(const std::filesystem::path& configDir) const;
};

class ConfigLoader {
public:
    /**
     * @brief Reads config.json from @p configDir.
     * @return Defaults if the file does not exist.
     * @throws domain::ConfigError on malformed JSON or ill-typed values.
     */
    static AppConfig Load(const std::filesystem::path& configDir);

    /**
     * @brief Parses config text. Keys that are absent keep their defaults.
     * @param origin Path used in error messages.
     */
    static AppConfig Parse(const std::string& content, const std::string& origin);
};

} // namespace kelvin::infrastructure
