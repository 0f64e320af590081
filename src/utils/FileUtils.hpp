// modeld - File Utilities
// Filesystem operations for download destinations and cleanup

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <filesystem>
#include <optional>
#include <system_error>

namespace fs = std::filesystem;

namespace modeld::utils {

/**
 * @brief File and directory utilities
 *
 * Size queries tolerate files vanishing underneath them (a concurrent
 * cleanup may be removing the tree); removal reports the first error
 * through an error_code instead of throwing.
 */
class FileUtils {
public:
    // Directory operations
    static bool createDirectories(const fs::path& path, std::error_code& ec);
    static bool directoryExists(const fs::path& path);
    static int64_t getDirectorySize(const fs::path& path);

    // File operations
    static bool fileExists(const fs::path& path);
    static std::optional<int64_t> getFileSize(const fs::path& path);
    static bool moveFile(const fs::path& source, const fs::path& destination, std::error_code& ec);

    /**
     * Size of a regular file, or the summed size of a directory tree
     */
    static int64_t getPathSize(const fs::path& path);

    /**
     * Remove a file or a whole directory tree.
     * A missing path is not an error.
     * @return number of filesystem entries removed
     */
    static std::uintmax_t removePath(const fs::path& path, std::error_code& ec);

    // Glob support (POSIX glob(3))
    static bool isGlobPattern(const std::string& path);
    static std::vector<std::string> expandGlob(const std::string& pattern);

    /**
     * Expand glob entries and keep plain entries as they are
     */
    static std::vector<std::string> expandPaths(const std::vector<std::string>& paths);
};

} // namespace modeld::utils
