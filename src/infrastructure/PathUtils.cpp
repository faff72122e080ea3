#include "infrastructure/PathUtils.hpp"
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace beplanner::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetDefaultDataDir() {
    return GetDataHome() / "BEPlanner";
}

fs::path PathUtils::GetDefaultConfigPath() {
    return GetConfigHome() / "BEPlanner" / "settings.json";
}

bool PathUtils::EnsureDirectory(const fs::path& dir) {
    std::error_code ec;
    if (fs::exists(dir, ec)) {
        return fs::is_directory(dir, ec);
    }
    fs::create_directories(dir, ec);
    if (ec) {
        std::cerr << "[PathUtils] Cannot create " << dir << ": " << ec.message() << std::endl;
        return false;
    }
    return true;
}

std::string PathUtils::SanitizeFileName(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            out.push_back(static_cast<char>(std::tolower(c)));
        } else if (!out.empty() && out.back() != '_') {
            out.push_back('_');
        }
    }
    while (!out.empty() && out.back() == '_') out.pop_back();
    return out.empty() ? "unnamed" : out;
}

} // namespace beplanner::infrastructure
