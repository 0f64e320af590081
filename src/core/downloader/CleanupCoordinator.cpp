/**
 * CleanupCoordinator.cpp
 */

#include "CleanupCoordinator.hpp"
#include "../Errors.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"

#include <utility>

namespace modeld::core::downloader {

using utils::FileUtils;

namespace {

void removeOrThrow(const fs::path& path) {
    std::error_code ec;
    auto removed = FileUtils::removePath(path, ec);
    if (ec) {
        throw CleanupError("failed to remove " + path.string() + ": " + ec.message());
    }
    if (removed > 0) {
        LOG_INFO("Removed {} ({} entries)", path.string(), removed);
    }
}

} // namespace

CleanupCoordinator::CleanupCoordinator(StorageLayout layout)
    : m_layout(std::move(layout)) {
}

bool CleanupCoordinator::cleanup(const WorkItem& item) const {
    bool clean = true;
    for (const auto& target : m_layout.cleanupTargets(item)) {
        try {
            removeOrThrow(target);
        } catch (const CleanupError& e) {
            LOG_WARN("Cleanup of model file {} ({}) incomplete: {}",
                     item.id, item.readableSource(), e.what());
            clean = false;
        }
    }
    return clean;
}

void CleanupCoordinator::deleteResolvedPaths(const std::vector<std::string>& paths) const {
    for (const auto& path : FileUtils::expandPaths(paths)) {
        removeOrThrow(path);
    }
}

} // namespace modeld::core::downloader
