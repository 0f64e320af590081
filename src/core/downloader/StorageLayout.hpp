#pragma once

/**
 * StorageLayout.hpp
 *
 * Where each work item lands on disk, which file marks an in-progress
 * transfer, and what cleanup has to remove.
 *
 * Layout under the cache directory when local_dir is not set:
 *   huggingface/<sanitized repo id>/...
 *   model_scope/<sanitized model id>/...
 *   ollama/<sanitized model name>          (shared by all Ollama items)
 */

#include "../models/WorkItem.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace modeld::core::downloader {

namespace fs = std::filesystem;

class StorageLayout {
public:
    explicit StorageLayout(fs::path cacheDir);

    const fs::path& getCacheDir() const { return m_cacheDir; }

    /**
     * Directory the driver writes into.
     * nullopt for local-path items, which are used in place.
     */
    std::optional<fs::path> destinationDir(const WorkItem& item) const;

    /**
     * Final file for single-file transfers, nullopt otherwise
     */
    std::optional<fs::path> singleFileTarget(const WorkItem& item) const;

    /**
     * Suffix the driver for this kind appends to in-progress files
     */
    static std::string partialSuffix(SourceKind kind);

    /**
     * Bytes already present locally for this item.
     * Directory transfers sum every regular file under the destination;
     * single-file transfers use the target, or its partial file when the
     * target does not exist yet.
     */
    int64_t resumeOffset(const WorkItem& item) const;

    /**
     * Paths cleanup must remove so the next attempt starts from empty.
     * A whole directory only when it belongs to this item alone.
     */
    std::vector<fs::path> cleanupTargets(const WorkItem& item) const;

private:
    fs::path m_cacheDir;
};

} // namespace modeld::core::downloader
