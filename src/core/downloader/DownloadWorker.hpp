#pragma once

/**
 * DownloadWorker.hpp
 *
 * One download execution for one work item:
 *   probe size (if unknown) -> resume offset -> initial progress ->
 *   driver transfer -> outcome.
 *
 * run() never throws. Cancellation and failures are cleaned up before
 * returning; only a size-probe failure leaves local state untouched.
 */

#include "CancellationSignal.hpp"
#include "CleanupCoordinator.hpp"
#include "ProgressReporter.hpp"
#include "WorkerOutcome.hpp"
#include "../sources/SourceDriver.hpp"

#include <chrono>

namespace modeld::core::downloader {

class DownloadWorker {
public:
    DownloadWorker(const sources::DriverRegistry& drivers,
                   const CleanupCoordinator& cleanup,
                   std::chrono::milliseconds progressInterval,
                   ProgressReporter::Clock clock = {});

    WorkerOutcome run(const WorkItem& item, CancellationSignal& cancel, WorkerReporter& reporter) const;

private:
    WorkerOutcome execute(const WorkItem& item, CancellationSignal& cancel, WorkerReporter& reporter) const;
    WorkerOutcome finishCancelled(const WorkItem& item, CancellationSignal& cancel) const;

    const sources::DriverRegistry& m_drivers;
    const CleanupCoordinator& m_cleanup;
    std::chrono::milliseconds m_progressInterval;
    ProgressReporter::Clock m_clock;
};

} // namespace modeld::core::downloader
