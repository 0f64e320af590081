/**
 * ProgressReporter.cpp
 */

#include "ProgressReporter.hpp"
#include "../Logger.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace modeld::core::downloader {

ProgressReporter::ProgressReporter(int64_t itemId,
                                   std::string label,
                                   int64_t totalSize,
                                   int64_t initialBytes,
                                   std::chrono::milliseconds interval,
                                   WorkerReporter& sink,
                                   Clock clock)
    : m_itemId(itemId)
    , m_label(std::move(label))
    , m_totalSize(totalSize)
    , m_downloaded(std::max<int64_t>(initialBytes, 0))
    , m_interval(interval)
    , m_sink(sink)
    , m_clock(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); })) {
}

double ProgressReporter::computePercentage(int64_t downloaded, int64_t total) {
    if (total <= 0) {
        return 100.0;
    }
    double raw = static_cast<double>(downloaded) / static_cast<double>(total) * 100.0;
    double rounded = std::round(raw * 100.0) / 100.0;
    return std::clamp(rounded, 0.0, 100.0);
}

double ProgressReporter::percent() const {
    return computePercentage(m_downloaded, m_totalSize);
}

void ProgressReporter::start() {
    if (m_downloaded > m_totalSize && !m_overshootWarned) {
        m_overshootWarned = true;
        LOG_WARN("Model file {} ({}): {} bytes already present exceed declared size {}",
                 m_itemId, m_label, m_downloaded, m_totalSize);
    }
    write(percent(), m_clock());
}

void ProgressReporter::advance(int64_t deltaBytes) {
    if (deltaBytes == 0) {
        return;
    }
    if (deltaBytes < 0) {
        // Discarded bytes lower the count; reported values stay put
        m_downloaded = std::max<int64_t>(m_downloaded + deltaBytes, 0);
        return;
    }
    m_downloaded += deltaBytes;

    if (m_downloaded > m_totalSize && !m_overshootWarned) {
        m_overshootWarned = true;
        LOG_WARN("Model file {} ({}): received {} bytes, more than declared size {}; clamping progress to 100",
                 m_itemId, m_label, m_downloaded, m_totalSize);
    }

    auto now = m_clock();
    double value = percent();
    bool finalTick = m_downloaded >= m_totalSize;

    if (m_lastReported && value <= *m_lastReported) {
        return;
    }
    if (!finalTick && m_lastReported && now - m_lastWrite < m_interval) {
        return;
    }
    write(value, now);
}

void ProgressReporter::write(double value, TimePoint now) {
    if (m_lastReported) {
        value = std::max(value, *m_lastReported);
    }
    m_lastReported = value;
    m_lastWrite = now;

    try {
        m_sink.reportProgress(m_itemId, value);
    } catch (const std::exception& e) {
        LOG_WARN("Failed to report progress {:.2f}% for model file {} ({}): {}",
                 value, m_itemId, m_label, e.what());
    }
}

} // namespace modeld::core::downloader
