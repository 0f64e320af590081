#pragma once

/**
 * LocalPathDriver.hpp
 *
 * Files already on this host. Nothing is copied; the path itself is
 * the resolved path once it is confirmed to exist.
 */

#include "SourceDriver.hpp"

namespace modeld::core::sources {

class LocalPathDriver : public SourceDriver {
public:
    SourceKind getKind() const override { return SourceKind::LocalPath; }

    int64_t probeSize(const WorkItem& item) override;

    std::vector<std::string> transfer(const WorkItem& item,
                                      const fs::path& destination,
                                      const ProgressCallback& onProgress,
                                      const downloader::CancellationSignal& cancel) override;
};

} // namespace modeld::core::sources
