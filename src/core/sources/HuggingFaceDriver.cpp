/**
 * HuggingFaceDriver.cpp
 */

#include "HuggingFaceDriver.hpp"
#include "../Errors.hpp"
#include "../Logger.hpp"
#include "../downloader/StorageLayout.hpp"
#include "../../utils/StringUtils.hpp"

#include <nlohmann/json.hpp>
#include <utility>

namespace modeld::core::sources {

using json = nlohmann::json;
using utils::StringUtils;

HuggingFaceDriver::HuggingFaceDriver(std::string endpoint, std::string token)
    : m_endpoint(std::move(endpoint))
    , m_token(std::move(token)) {
    while (StringUtils::endsWith(m_endpoint, "/")) {
        m_endpoint.pop_back();
    }
}

utils::HttpOptions HuggingFaceDriver::requestOptions() const {
    utils::HttpOptions options;
    options.withBearer(m_token);
    return options;
}

std::vector<RemoteFile> HuggingFaceDriver::listFiles(const HuggingFaceSource& source) {
    auto url = m_endpoint + "/api/models/" + source.repoId + "/tree/main?recursive=true";
    auto response = m_client.get(url, requestOptions());
    if (!response.isSuccess()) {
        throw SizeProbeError("listing " + source.repoId + " failed: " + response.describe());
    }

    json entries;
    try {
        entries = json::parse(response.body);
    } catch (const json::exception& e) {
        throw SizeProbeError("listing " + source.repoId + " is not valid JSON: " + e.what());
    }
    if (!entries.is_array()) {
        throw SizeProbeError("listing " + source.repoId + " is not an array");
    }

    std::vector<RemoteFile> files;
    for (const auto& entry : entries) {
        if (entry.value("type", "") != "file") continue;

        auto path = entry.value("path", "");
        if (path.empty()) continue;
        if (source.isSingleFile() && path != source.filename) continue;

        RemoteFile file;
        file.relativePath = path;
        file.url = m_endpoint + "/" + source.repoId + "/resolve/main/" + encodePath(path);

        // LFS entries report the pointer size in "size"; the real size
        // and digest live under "lfs".
        if (entry.contains("lfs") && entry["lfs"].is_object()) {
            const auto& lfs = entry["lfs"];
            file.size = lfs.value("size", entry.value("size", int64_t{0}));
            file.sha256 = lfs.value("oid", "");
        } else {
            file.size = entry.value("size", int64_t{0});
        }
        files.push_back(std::move(file));
    }

    if (source.isSingleFile() && files.empty()) {
        throw SizeProbeError(source.filename + " not found in " + source.repoId);
    }
    return files;
}

int64_t HuggingFaceDriver::probeSize(const WorkItem& item) {
    const auto& source = std::get<HuggingFaceSource>(item.source);
    int64_t total = 0;
    for (const auto& file : listFiles(source)) {
        total += file.size.value_or(0);
    }
    return total;
}

std::vector<std::string> HuggingFaceDriver::transfer(const WorkItem& item,
                                                     const fs::path& destination,
                                                     const ProgressCallback& onProgress,
                                                     const downloader::CancellationSignal& cancel) {
    const auto& source = std::get<HuggingFaceSource>(item.source);

    std::vector<RemoteFile> files;
    try {
        files = listFiles(source);
    } catch (const SizeProbeError& e) {
        throw TransferError(e.what());
    }

    HttpTransfer http(m_client, requestOptions(), downloader::StorageLayout::partialSuffix(getKind()));
    for (const auto& file : files) {
        http.fetch(file, destination / file.relativePath, onProgress, cancel);
    }

    LOG_INFO("Fetched {} file(s) from huggingface/{}", files.size(), source.repoId);
    if (source.isSingleFile()) {
        return {(destination / source.filename).string()};
    }
    return {destination.string()};
}

} // namespace modeld::core::sources
