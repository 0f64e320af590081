#pragma once

/**
 * ProgressReporter.hpp
 *
 * Turns byte deltas from a source driver into one monotonic, throttled
 * percentage per work item.
 *
 * - percent = clamp(round((initial + received) / size * 100, 2), 0, 100)
 * - at most one write per interval, except the final tick (downloaded >= size)
 * - a declared size of 0 reports 100
 * - overshoot is clamped and warned about once
 */

#include "WorkerOutcome.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace modeld::core::downloader {

class ProgressReporter {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Clock = std::function<TimePoint()>;

    ProgressReporter(int64_t itemId,
                     std::string label,
                     int64_t totalSize,
                     int64_t initialBytes,
                     std::chrono::milliseconds interval,
                     WorkerReporter& sink,
                     Clock clock = {});

    /**
     * Emit the resume baseline before any new bytes arrive.
     * Counts as a write for the throttle.
     */
    void start();

    /**
     * Account for newly received bytes and write if the throttle allows.
     * A negative delta withdraws bytes a restarted file had already
     * contributed; nothing is written for it.
     */
    void advance(int64_t deltaBytes);

    double percent() const;
    int64_t getDownloaded() const { return m_downloaded; }
    std::optional<double> getLastReported() const { return m_lastReported; }

    static double computePercentage(int64_t downloaded, int64_t total);

private:
    void write(double value, TimePoint now);

    int64_t m_itemId;
    std::string m_label;
    int64_t m_totalSize;
    int64_t m_downloaded;
    std::chrono::milliseconds m_interval;
    WorkerReporter& m_sink;
    Clock m_clock;

    std::optional<double> m_lastReported;
    TimePoint m_lastWrite{};
    bool m_overshootWarned{false};
};

} // namespace modeld::core::downloader
