#pragma once

#include <filesystem>
#include <string>
#include <cstdlib>

namespace modeld::utils {

namespace fs = std::filesystem;

class PathUtils {
public:
    static fs::path getAppDataPath() {
        if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
            return fs::path(xdg);
        }
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / ".local" / "share" : fs::current_path();
    }

    static fs::path getDataPath() {
        return getAppDataPath() / "modeld";
    }

    static fs::path getConfigPath() {
        return getDataPath() / "config.json";
    }

    static fs::path getCachePath() {
        return getDataPath() / "cache";
    }

    static fs::path getLogsPath() {
        return getDataPath() / "logs";
    }

    /**
     * Configured directory, or the fallback when the setting is empty
     */
    static fs::path orDefault(const std::string& configured, const fs::path& fallback) {
        return configured.empty() ? fallback : fs::path(configured);
    }
};

} // namespace modeld::utils
