/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include "domain/Errors.hpp"
#include <cstdint>
#include <filesystem>
#include <limits>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace kelvin::infrastructure {

std::filesystem::path AppConfig::dataFilePath(const std::filesystem::path& configDir) const {
    if (dataFile) {
        return PathUtils::ExpandTilde(*dataFile);
    }
    return configDir / "tasks.json";
}

AppConfig ConfigLoader::Load(const std::filesystem::path& configDir) {
    std::filesystem::path configPath = configDir / "config.json";
    if (!std::filesystem::exists(configPath)) {
        return AppConfig{};
    }

    std::ifstream f(configPath);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Cannot open " << configPath.string() << std::endl;
        throw domain::ConfigError(configPath.string(), "Failed to read " + configPath.string());
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return Parse(buffer.str(), configPath.string());
}

AppConfig ConfigLoader::Parse(const std::string& content, const std::string& origin) {
    AppConfig config;
    if (content.find_first_not_of(" \t\r\n") == std::string::npos) {
        return config;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(content);
        if (!j.is_object()) {
            throw domain::ConfigError(origin, "Invalid config " + origin + ": top level must be an object");
        }

        if (j.contains("defaults")) {
            const auto& defaults = j.at("defaults");
            if (defaults.contains("thaw_days")) {
                const auto& thawDays = defaults.at("thaw_days");
                if (!thawDays.is_number_integer()) {
                    throw domain::ConfigError(origin, "Invalid config " + origin + ": defaults.thaw_days must be an integer");
                }
                // Range-check before narrowing; get<int>() would wrap.
                const bool inRange = thawDays.is_number_unsigned()
                    ? thawDays.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                    : thawDays.get<std::int64_t>() >= 0 &&
                      thawDays.get<std::int64_t>() <= std::numeric_limits<int>::max();
                if (!inRange) {
                    throw domain::ConfigError(origin, "Invalid config " + origin +
                                              ": defaults.thaw_days must be between 0 and " +
                                              std::to_string(std::numeric_limits<int>::max()));
                }
                const auto value = thawDays.get<std::int64_t>();
                config.thawDays = static_cast<int>(value);
            }
        }
        if (j.contains("storage")) {
            const auto& storage = j.at("storage");
            if (storage.contains("data_file") && !storage.at("data_file").is_null()) {
                config.dataFile = storage.at("data_file").get<std::string>();
            }
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << origin << ": " << e.what() << std::endl;
        throw domain::ConfigError(origin, "Invalid config " + origin + ": " + e.what());
    }
    return config;
}

} // namespace kelvin::infrastructure
