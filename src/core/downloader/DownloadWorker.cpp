/**
 * DownloadWorker.cpp
 */

#include "DownloadWorker.hpp"
#include "../Errors.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

#include <utility>

namespace modeld::core::downloader {

using utils::StringUtils;

DownloadWorker::DownloadWorker(const sources::DriverRegistry& drivers,
                               const CleanupCoordinator& cleanup,
                               std::chrono::milliseconds progressInterval,
                               ProgressReporter::Clock clock)
    : m_drivers(drivers)
    , m_cleanup(cleanup)
    , m_progressInterval(progressInterval)
    , m_clock(std::move(clock)) {
}

WorkerOutcome DownloadWorker::run(const WorkItem& item, CancellationSignal& cancel, WorkerReporter& reporter) const {
    try {
        return execute(item, cancel, reporter);
    } catch (const CancellationError&) {
        return finishCancelled(item, cancel);
    } catch (const SizeProbeError& e) {
        if (cancel.isCancelled()) {
            return finishCancelled(item, cancel);
        }
        LOG_WARN("Size probe for model file {} ({}) failed: {}", item.id, item.readableSource(), e.what());
        return WorkerOutcome::sizeProbeFailed(e.what());
    } catch (const std::exception& e) {
        // A driver aborted by the signal may surface any error type
        if (cancel.isCancelled()) {
            return finishCancelled(item, cancel);
        }
        LOG_ERROR("Failed to download model file {} ({}): {}", item.id, item.readableSource(), e.what());
        m_cleanup.cleanup(item);
        return WorkerOutcome::transferFailed(e.what());
    }
}

WorkerOutcome DownloadWorker::finishCancelled(const WorkItem& item, CancellationSignal& cancel) const {
    LOG_INFO("Download of model file {} ({}) cancelled", item.id, item.readableSource());
    m_cleanup.cleanup(item);
    cancel.acknowledge();
    return WorkerOutcome::cancelled();
}

WorkerOutcome DownloadWorker::execute(const WorkItem& item, CancellationSignal& cancel, WorkerReporter& reporter) const {
    auto kind = kindOf(item.source);
    auto driver = m_drivers.find(kind);
    if (!driver) {
        throw TransferError("no driver registered for source " + toString(kind));
    }

    WorkItem working = item;
    auto label = working.readableSource();

    if (!working.size) {
        int64_t size = driver->probeSize(working);
        try {
            reporter.reportSize(working.id, size);
        } catch (const std::exception& e) {
            throw SizeProbeError("could not persist size " + std::to_string(size) + ": " + e.what());
        }
        LOG_INFO("Model file {} ({}) size probed: {}", working.id, label, StringUtils::formatBytes(size));
        working.size = size;
    }

    if (cancel.isCancelled()) {
        throw CancellationError();
    }

    const auto& layout = m_cleanup.getLayout();
    auto destination = layout.destinationDir(working);
    int64_t initial = layout.resumeOffset(working);

    ProgressReporter progress(working.id, label, *working.size, initial, m_progressInterval, reporter, m_clock);
    if (initial > 0) {
        LOG_INFO("Resuming model file {} ({}) from {} ({}%)", working.id, label,
                 StringUtils::formatBytes(initial), StringUtils::formatPercentage(progress.percent()));
    } else {
        LOG_INFO("Downloading model file {} ({})", working.id, label);
    }
    progress.start();

    auto paths = driver->transfer(working, destination.value_or(fs::path{}),
        [&cancel, &progress](int64_t delta) {
            if (cancel.isCancelled()) {
                throw CancellationError();
            }
            progress.advance(delta);
        }, cancel);

    // A success that raced with a cancel request is a cancellation
    if (cancel.isCancelled()) {
        throw CancellationError();
    }
    if (paths.empty()) {
        throw TransferError("driver returned no paths");
    }

    LOG_INFO("Model file {} ({}) downloaded", working.id, label);
    return WorkerOutcome::success(std::move(paths));
}

} // namespace modeld::core::downloader
