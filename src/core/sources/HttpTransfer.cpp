/**
 * HttpTransfer.cpp
 */

#include "HttpTransfer.hpp"
#include "../Errors.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/HashUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <utility>

namespace modeld::core::sources {

using utils::FileUtils;
using utils::HashUtils;
using utils::StringUtils;

std::string encodePath(const std::string& path) {
    std::vector<std::string> encoded;
    for (const auto& segment : StringUtils::split(path, '/')) {
        encoded.push_back(utils::HttpClient::urlEncode(segment));
    }
    return StringUtils::join(encoded, "/");
}

HttpTransfer::HttpTransfer(utils::HttpClient& client, utils::HttpOptions options, std::string partialSuffix)
    : m_client(client)
    , m_options(std::move(options))
    , m_partialSuffix(std::move(partialSuffix)) {
}

fs::path HttpTransfer::partialPathFor(const fs::path& target) const {
    return fs::path(target.string() + m_partialSuffix);
}

bool HttpTransfer::supportsRanges(const std::string& url) {
    auto response = m_client.head(url, m_options);
    if (!response.isSuccess()) {
        LOG_DEBUG("HEAD {} failed ({}); not resuming", url, response.describe());
        return false;
    }
    return StringUtils::toLower(response.header("Accept-Ranges")) == "bytes";
}

void HttpTransfer::fetch(const RemoteFile& file,
                         const fs::path& target,
                         const ProgressCallback& onProgress,
                         const downloader::CancellationSignal& cancel) {
    if (cancel.isCancelled()) {
        throw CancellationError();
    }

    // Already complete from an earlier attempt; its bytes are part of the
    // resume baseline.
    if (auto existing = FileUtils::getFileSize(target)) {
        if (!file.size || *existing == *file.size) {
            LOG_DEBUG("{} already present, skipping", target.string());
            return;
        }
        LOG_WARN("{} has {} bytes, expected {}; downloading again", target.string(), *existing, *file.size);
        std::error_code ec;
        FileUtils::removePath(target, ec);
        if (ec) {
            throw TransferError("cannot replace " + target.string() + ": " + ec.message());
        }
        onProgress(-*existing);
    }

    std::error_code ec;
    if (!FileUtils::createDirectories(target.parent_path(), ec)) {
        throw TransferError("cannot create " + target.parent_path().string() + ": " + ec.message());
    }

    auto partial = partialPathFor(target);
    int64_t offset = FileUtils::getFileSize(partial).value_or(0);

    if (offset > 0 && file.size && offset > *file.size) {
        LOG_WARN("Partial file {} is larger than expected; restarting", partial.string());
        onProgress(-offset);
        offset = 0;
    }
    if (offset > 0 && file.size && offset == *file.size) {
        LOG_DEBUG("Partial file {} is complete", partial.string());
    } else {
        if (offset > 0 && !supportsRanges(file.url)) {
            LOG_INFO("Server does not accept ranges for {}; restarting from 0", file.url);
            onProgress(-offset);
            offset = 0;
        }

        if (offset > 0) {
            LOG_INFO("Resuming {} at {}", file.relativePath, StringUtils::formatBytes(offset));
        } else {
            LOG_INFO("Downloading {}", file.relativePath);
        }

        auto options = m_options;
        options.timeoutSeconds = 0;

        auto response = m_client.downloadToFile(file.url, partial.string(), offset,
            [&](int64_t delta) {
                if (cancel.isCancelled()) {
                    throw CancellationError();
                }
                if (delta != 0) {
                    onProgress(delta);
                }
                return true;
            }, options);

        if (response.rangeIgnored) {
            LOG_WARN("Server ignored range request for {}; file restarted from 0", file.url);
        }
        if (!response.isSuccess()) {
            throw TransferError("failed to download " + file.relativePath + ": " + response.describe());
        }
    }

    auto actual = FileUtils::getFileSize(partial).value_or(0);
    if (file.size && actual != *file.size) {
        throw TransferError("size mismatch for " + file.relativePath + ": got " +
                            std::to_string(actual) + " bytes, expected " + std::to_string(*file.size));
    }

    if (!file.sha256.empty() && !HashUtils::verifySha256(partial.string(), file.sha256)) {
        FileUtils::removePath(partial, ec);
        if (ec) {
            LOG_WARN("Could not remove corrupt {}: {}", partial.string(), ec.message());
        }
        throw TransferError("checksum mismatch for " + file.relativePath);
    }

    if (!FileUtils::moveFile(partial, target, ec)) {
        throw TransferError("cannot move " + partial.string() + " to " + target.string() + ": " + ec.message());
    }
}

} // namespace modeld::core::sources
