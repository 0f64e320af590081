/**
 * FileUtils.cpp
 *
 * Filesystem operations for download destinations and cleanup.
 */

#include "FileUtils.hpp"

#include <glob.h>

namespace modeld::utils {

// -- Directory operations --

bool FileUtils::createDirectories(const fs::path& path, std::error_code& ec) {
    ec.clear();
    fs::create_directories(path, ec);
    return !ec;
}

bool FileUtils::directoryExists(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

int64_t FileUtils::getDirectorySize(const fs::path& path) {
    int64_t size = 0;
    std::error_code ec;
    if (!fs::is_directory(path, ec)) return 0;

    fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
    fs::recursive_directory_iterator end;
    while (!ec && it != end) {
        std::error_code entryEc;
        if (it->is_regular_file(entryEc)) {
            auto fileSize = it->file_size(entryEc);
            if (!entryEc) size += static_cast<int64_t>(fileSize);
        }
        it.increment(ec);
    }
    return size;
}

// -- File operations --

bool FileUtils::fileExists(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::optional<int64_t> FileUtils::getFileSize(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return std::nullopt;
    auto size = fs::file_size(path, ec);
    if (ec) return std::nullopt;
    return static_cast<int64_t>(size);
}

bool FileUtils::moveFile(const fs::path& source, const fs::path& destination, std::error_code& ec) {
    ec.clear();
    fs::rename(source, destination, ec);
    return !ec;
}

int64_t FileUtils::getPathSize(const fs::path& path) {
    if (auto size = getFileSize(path)) return *size;
    return getDirectorySize(path);
}

std::uintmax_t FileUtils::removePath(const fs::path& path, std::error_code& ec) {
    ec.clear();
    auto status = fs::symlink_status(path, ec);
    if (ec) {
        // Nothing to remove
        if (ec == std::errc::no_such_file_or_directory) ec.clear();
        return 0;
    }
    if (!fs::exists(status)) return 0;

    auto removed = fs::remove_all(path, ec);
    return removed == static_cast<std::uintmax_t>(-1) ? 0 : removed;
}

// -- Glob --

bool FileUtils::isGlobPattern(const std::string& path) {
    return path.find_first_of("*?[") != std::string::npos;
}

std::vector<std::string> FileUtils::expandGlob(const std::string& pattern) {
    std::vector<std::string> matches;
    glob_t result{};
    int rc = ::glob(pattern.c_str(), GLOB_NOSORT, nullptr, &result);
    if (rc == 0) {
        for (size_t i = 0; i < result.gl_pathc; ++i) {
            matches.emplace_back(result.gl_pathv[i]);
        }
    }
    ::globfree(&result);
    return matches;
}

std::vector<std::string> FileUtils::expandPaths(const std::vector<std::string>& paths) {
    std::vector<std::string> expanded;
    for (const auto& path : paths) {
        if (isGlobPattern(path)) {
            auto matches = expandGlob(path);
            expanded.insert(expanded.end(), matches.begin(), matches.end());
        } else {
            expanded.push_back(path);
        }
    }
    return expanded;
}

} // namespace modeld::utils
