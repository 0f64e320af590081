#pragma once

/**
 * HttpTransfer.hpp
 *
 * Resumable single-file HTTP download shared by the remote drivers.
 *
 * The body goes to "<target><partialSuffix>"; an existing partial file is
 * resumed with a Range request when the server advertises byte ranges.
 * On completion the size and, when known, the SHA-256 are checked before
 * the partial file is renamed to the target.
 */

#include "SourceDriver.hpp"
#include "../../utils/HttpClient.hpp"

#include <optional>
#include <string>

namespace modeld::core::sources {

struct RemoteFile {
    std::string url;
    std::string relativePath;       // path below the destination directory
    std::optional<int64_t> size;
    std::string sha256;             // empty when unknown
};

class HttpTransfer {
public:
    HttpTransfer(utils::HttpClient& client, utils::HttpOptions options, std::string partialSuffix);

    /**
     * Download one file to target
     * @throws TransferError, CancellationError
     */
    void fetch(const RemoteFile& file,
               const fs::path& target,
               const ProgressCallback& onProgress,
               const downloader::CancellationSignal& cancel);

    fs::path partialPathFor(const fs::path& target) const;

private:
    bool supportsRanges(const std::string& url);

    utils::HttpClient& m_client;
    utils::HttpOptions m_options;
    std::string m_partialSuffix;
};

/**
 * Percent-encode each segment of a slash-separated path
 */
std::string encodePath(const std::string& path);

} // namespace modeld::core::sources
