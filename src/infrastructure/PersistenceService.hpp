/**
 * @file PersistenceService.hpp
 * @brief Centralized service for atomic file I/O operations.
 */

#pragma once
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace beplanner::infrastructure {

/**
 * @class PersistenceService
 * @brief Performs atomic file writes (temp -> rename) and plain reads.
 *
 * A reader never observes a partially written file: content is written to a sibling
 * temporary file which is then renamed over the target.
 */
class PersistenceService {
public:
    /**
     * @brief Writes @p content to @p filename atomically, creating parent directories.
     * @throws std::runtime_error if any step fails. The target is left untouched in that case.
     */
    void writeTextAtomic(const std::filesystem::path& filename, const std::string& content);

    /**
     * @brief Reads a whole file.
     * @return nullopt if the file does not exist.
     * @throws std::runtime_error if the file exists but cannot be read.
     */
    std::optional<std::string> readText(const std::filesystem::path& filename) const;

private:
    mutable std::mutex m_mutex;
    size_t m_sequence = 0;
};

} // namespace beplanner::infrastructure
