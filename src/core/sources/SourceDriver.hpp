#pragma once

/**
 * SourceDriver.hpp
 *
 * One driver per source kind. The orchestrator only asks a driver for
 * the total size and to transfer an item into a destination; resume,
 * partial-file naming and integrity checks are the driver's business.
 */

#include "../models/WorkItem.hpp"
#include "../downloader/CancellationSignal.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace modeld::core::sources {

namespace fs = std::filesystem;

/**
 * Receives incremental byte counts as data lands on disk. A negative
 * count withdraws bytes already counted, for a file that starts over.
 * Throws CancellationError to stop the transfer.
 */
using ProgressCallback = std::function<void(int64_t deltaBytes)>;

class SourceDriver {
public:
    virtual ~SourceDriver() = default;

    virtual SourceKind getKind() const = 0;

    /**
     * Total number of bytes the transfer will produce
     * @throws SizeProbeError
     */
    virtual int64_t probeSize(const WorkItem& item) = 0;

    /**
     * Bring the item's bytes into destination (empty for local paths)
     * @return concrete paths to record as resolved_paths
     * @throws TransferError, CancellationError
     */
    virtual std::vector<std::string> transfer(const WorkItem& item,
                                              const fs::path& destination,
                                              const ProgressCallback& onProgress,
                                              const downloader::CancellationSignal& cancel) = 0;
};

/**
 * Source kind -> driver lookup. Drivers are shared by every execution
 * and must be safe to call concurrently.
 */
class DriverRegistry {
public:
    void add(std::shared_ptr<SourceDriver> driver) {
        auto kind = driver->getKind();
        m_drivers[kind] = std::move(driver);
    }

    std::shared_ptr<SourceDriver> find(SourceKind kind) const {
        auto it = m_drivers.find(kind);
        return it == m_drivers.end() ? nullptr : it->second;
    }

    size_t size() const { return m_drivers.size(); }

private:
    std::map<SourceKind, std::shared_ptr<SourceDriver>> m_drivers;
};

} // namespace modeld::core::sources
