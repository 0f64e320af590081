#pragma once

/**
 * CleanupCoordinator.hpp
 *
 * Best-effort removal of a work item's local artifacts. Used by the
 * worker after a cancelled or failed transfer and by the scheduler after
 * a deletion. Every operation is idempotent on missing paths, so both
 * sides may run it for the same item.
 */

#include "StorageLayout.hpp"
#include "../models/WorkItem.hpp"

#include <string>
#include <vector>

namespace modeld::core::downloader {

class CleanupCoordinator {
public:
    explicit CleanupCoordinator(StorageLayout layout);

    const StorageLayout& getLayout() const { return m_layout; }

    /**
     * Remove partial and complete artifacts of an item.
     * Failures are logged as CleanupError and never thrown.
     * @return true if every target is gone afterwards
     */
    bool cleanup(const WorkItem& item) const;

    /**
     * Delete resolved paths, expanding glob entries ('*', '?', '[').
     * Files and directory trees are both removed.
     * @throws CleanupError naming the first path that could not be removed
     */
    void deleteResolvedPaths(const std::vector<std::string>& paths) const;

private:
    StorageLayout m_layout;
};

} // namespace modeld::core::downloader
