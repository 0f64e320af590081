#pragma once

/**
 * Errors.hpp
 *
 * Exception taxonomy shared by the scheduler, the download workers,
 * the source drivers and the record clients.
 */

#include <stdexcept>
#include <string>

namespace modeld::core {

/**
 * Base class for every orchestrator failure
 */
class DownloadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Metadata lookup for the total size failed.
 * Not retried internally; the item stays downloading and is picked up
 * again on the next CREATED/UPDATED delivery.
 */
class SizeProbeError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

/**
 * Network, auth, integrity or driver failure. Terminal.
 */
class TransferError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

/**
 * Raised inside a transfer once its cancellation signal is set
 */
class CancellationError : public DownloadError {
public:
    CancellationError() : DownloadError("download cancelled") {}
    using DownloadError::DownloadError;
};

/**
 * Filesystem cleanup failed. Logged, never escalated.
 */
class CleanupError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

/**
 * Record store read or write failed
 */
class RecordStoreError : public DownloadError {
public:
    RecordStoreError(const std::string& message, int statusCode = 0)
        : DownloadError(message), m_statusCode(statusCode) {}

    int getStatusCode() const { return m_statusCode; }

private:
    int m_statusCode;
};

/**
 * Change feed subscription failed or was rejected
 */
class FeedError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

} // namespace modeld::core
