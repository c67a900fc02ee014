/**
 * @file JsonTaskStore.cpp
 * @brief Implementation of JsonTaskStore.
 */

#include "infrastructure/JsonTaskStore.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <unordered_set>
#include <nlohmann/json.hpp>

#include "domain/Errors.hpp"

namespace fs = std::filesystem;

namespace kelvin::infrastructure {

using json = nlohmann::json;

namespace {

json DateToJson(const std::optional<domain::Date>& date) {
    if (!date) return nullptr;
    return date->toString();
}

domain::Date DateFromJson(const json& value, const char* field) {
    auto date = domain::Date::Parse(value.get<std::string>());
    if (!date) {
        throw std::invalid_argument(std::string("bad date in '") + field + "': " + value.get<std::string>());
    }
    return *date;
}

std::optional<domain::Date> OptionalDateFromJson(const json& obj, const char* field) {
    if (!obj.contains(field) || obj.at(field).is_null()) return std::nullopt;
    return DateFromJson(obj.at(field), field);
}

json TaskToJson(const domain::Task& task) {
    return json{
        {"id", task.id},
        {"title", task.title},
        {"description", task.description},
        {"state", domain::StateToKey(task.state)},
        {"thaw_date", DateToJson(task.thawDate)},
        {"due_date", DateToJson(task.dueDate)},
        {"created_at", task.createdAt.toString()}
    };
}

std::uint32_t IdFromJson(const json& value) {
    if (!value.is_number_unsigned()) {
        throw std::invalid_argument("id must be a positive integer: " + value.dump());
    }
    const auto id = value.get<std::uint64_t>();
    if (id == 0 || id > std::numeric_limits<std::uint32_t>::max()) {
        throw std::invalid_argument("id out of range: " + value.dump());
    }
    return static_cast<std::uint32_t>(id);
}

domain::Task TaskFromJson(const json& j) {
    domain::Task task(IdFromJson(j.at("id")),
                      j.at("title").get<std::string>(),
                      DateFromJson(j.at("created_at"), "created_at"));
    task.description = j.value("description", "");

    std::string key = j.at("state").get<std::string>();
    auto state = domain::StateFromKey(key);
    if (!state) {
        throw std::invalid_argument("unknown state '" + key + "'");
    }
    task.state = *state;
    task.thawDate = OptionalDateFromJson(j, "thaw_date");
    task.dueDate = OptionalDateFromJson(j, "due_date");
    return task;
}

} // namespace

JsonTaskStore::JsonTaskStore(fs::path path) : m_path(std::move(path)) {}

std::string JsonTaskStore::Serialize(const std::vector<domain::Task>& tasks) {
    json arr = json::array();
    for (const auto& task : tasks) {
        arr.push_back(TaskToJson(task));
    }
    return arr.dump(2);
}

std::vector<domain::Task> JsonTaskStore::Deserialize(const std::string& content, const std::string& origin) {
    std::vector<domain::Task> tasks;
    if (content.find_first_not_of(" \t\r\n") == std::string::npos) {
        return tasks;
    }

    try {
        json arr = json::parse(content);
        if (!arr.is_array()) {
            throw std::invalid_argument("top level is not an array");
        }
        std::unordered_set<std::uint32_t> seen;
        for (const auto& item : arr) {
            domain::Task task = TaskFromJson(item);
            if (!seen.insert(task.id).second) {
                throw std::invalid_argument("duplicate id " + std::to_string(task.id));
            }
            tasks.push_back(std::move(task));
        }
    } catch (const std::exception& e) {
        std::cerr << "[JsonTaskStore] Error parsing " << origin << ": " << e.what() << std::endl;
        throw domain::StorageError(origin, "Failed to parse " + origin + ": " + e.what());
    }
    return tasks;
}

std::vector<domain::Task> JsonTaskStore::load() {
    std::error_code ec;
    const bool exists = fs::exists(m_path, ec);
    if (ec) {
        std::cerr << "[JsonTaskStore] Cannot stat " << m_path.string() << ": " << ec.message() << std::endl;
        throw domain::StorageError(m_path.string(), "Failed to read " + m_path.string() + ": " + ec.message());
    }
    if (!exists) {
        return {};
    }
    if (!fs::is_regular_file(m_path, ec)) {
        std::cerr << "[JsonTaskStore] Not a regular file: " << m_path.string() << std::endl;
        throw domain::StorageError(m_path.string(), "Failed to read " + m_path.string() + ": not a regular file");
    }

    std::ifstream file(m_path);
    if (!file.is_open()) {
        std::cerr << "[JsonTaskStore] Failed to open " << m_path.string() << std::endl;
        throw domain::StorageError(m_path.string(), "Failed to read " + m_path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw domain::StorageError(m_path.string(), "Failed to read " + m_path.string());
    }
    return Deserialize(buffer.str(), m_path.string());
}

void JsonTaskStore::save(const std::vector<domain::Task>& tasks) {
    const std::string content = Serialize(tasks);

    // Unique temp path beside the target: tasks.json.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = m_path;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    // 1. Ensure directory exists
    try {
        if (m_path.has_parent_path() && !fs::exists(m_path.parent_path())) {
            fs::create_directories(m_path.parent_path());
        }
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[JsonTaskStore] Error creating directories: " << e.what() << std::endl;
        throw domain::StorageError(m_path.string(),
            "Failed to create directory " + m_path.parent_path().string() + ": " + e.what());
    }

    // 2. Write to temp
    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            std::cerr << "[JsonTaskStore] Failed to open temp file: " << tempPath.string() << std::endl;
            throw domain::StorageError(m_path.string(), "Failed to write " + m_path.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[JsonTaskStore] Write failed during output: " << tempPath.string() << std::endl;
            ofs.close();
            std::error_code ec;
            fs::remove(tempPath, ec);
            throw domain::StorageError(m_path.string(), "Failed to write " + m_path.string());
        }
    }

    // 3. Atomic rename
    try {
        fs::rename(tempPath, m_path);
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[JsonTaskStore] Rename failed: " << e.what() << std::endl;
        std::error_code ec;
        fs::remove(tempPath, ec);
        throw domain::StorageError(m_path.string(), "Failed to write " + m_path.string() + ": " + e.what());
    }
}

} // namespace kelvin::infrastructure
