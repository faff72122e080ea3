// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace beplanner::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief Default data directory: $XDG_DATA_HOME/BEPlanner. */
    static std::filesystem::path GetDefaultDataDir();

    /** @brief Default settings file: $XDG_CONFIG_HOME/BEPlanner/settings.json. */
    static std::filesystem::path GetDefaultConfigPath();

    /** @brief Creates @p dir if missing. Returns false (and logs) on failure. */
    static bool EnsureDirectory(const std::filesystem::path& dir);

    /** @brief Lowercase file-name-safe rendering of @p text ("Ibuprofen 400" -> "ibuprofen_400"). */
    static std::string SanitizeFileName(const std::string& text);
};

} // namespace beplanner::infrastructure
