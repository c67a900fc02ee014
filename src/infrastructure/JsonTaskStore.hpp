/**
 * @file JsonTaskStore.hpp
 * @brief Single-file JSON implementation of the TaskRepository.
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "domain/TaskRepository.hpp"

namespace kelvin::infrastructure {

/**
 * @class JsonTaskStore
 * @brief Stores the whole task collection as a pretty-printed JSON array.
 *
 * Writes go through a temp file and a rename in the same directory, so a
 * reader sees either the old or the new file. There is no locking: two
 * concurrent writers still resolve as last-writer-wins.
 */
class JsonTaskStore : public domain::TaskRepository {
public:
    explicit JsonTaskStore(std::filesystem::path path);

    /** @throws domain::StorageError on read or parse failure. */
    std::vector<domain::Task> load() override;

    /** @throws domain::StorageError on write failure. */
    void save(const std::vector<domain::Task>& tasks) override;

    const std::filesystem::path& path() const { return m_path; }

    /** @brief Serializes @p tasks to the on-disk JSON text. */
    static std::string Serialize(const std::vector<domain::Task>& tasks);

    /**
     * @brief Parses on-disk JSON text.
     * @param origin Path used in error messages.
     * @throws domain::StorageError on malformed content.
     */
    static std::vector<domain::Task> Deserialize(const std::string& content, const std::string& origin);

private:
    std::filesystem::path m_path; ///< Location of tasks.json.
};

} // namespace kelvin::infrastructure
