/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace beplanner::infrastructure {

namespace fs = std::filesystem;

void PersistenceService::writeTextAtomic(const fs::path& filename, const std::string& content) {
    const fs::path finalPath = filename;

    // Create unique temp path: filename.<timestamp>.<sequence>.tmp
    size_t sequence = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        sequence = ++m_sequence;
    }
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + "." + std::to_string(sequence) + ".tmp";

    // 1. Ensure directory exists
    std::error_code ec;
    if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path(), ec)) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            std::cerr << "[PersistenceService] Error creating directories: " << ec.message() << std::endl;
            throw std::runtime_error("cannot create directory " + finalPath.parent_path().string() + ": " + ec.message());
        }
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            std::cerr << "[PersistenceService] Failed to open temp file: " << tempPath << std::endl;
            throw std::runtime_error("cannot open " + tempPath.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[PersistenceService] Write failed during output: " << tempPath << std::endl;
            ofs.close();
            fs::remove(tempPath, ec);
            throw std::runtime_error("write failed for " + tempPath.string());
        }
    } // Close happens here automatically

    // 3. Atomic Rename
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[PersistenceService] Rename failed: " << ec.message() << std::endl;
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        throw std::runtime_error("cannot rename into " + finalPath.string() + ": " + ec.message());
    }
}

std::optional<std::string> PersistenceService::readText(const fs::path& filename) const {
    std::error_code ec;
    if (!fs::exists(filename, ec)) {
        return std::nullopt;
    }
    std::ifstream ifs(filename, std::ios::binary);
    if (!ifs.is_open()) {
        throw std::runtime_error("cannot open " + filename.string());
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    if (ifs.bad()) {
        throw std::runtime_error("read failed for " + filename.string());
    }
    return buffer.str();
}

} // namespace beplanner::infrastructure
