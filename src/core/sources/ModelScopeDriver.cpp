/**
 * ModelScopeDriver.cpp
 */

#include "ModelScopeDriver.hpp"
#include "../Errors.hpp"
#include "../Logger.hpp"
#include "../downloader/StorageLayout.hpp"
#include "../../utils/StringUtils.hpp"

#include <nlohmann/json.hpp>
#include <utility>

namespace modeld::core::sources {

using json = nlohmann::json;
using utils::StringUtils;

ModelScopeDriver::ModelScopeDriver(std::string endpoint)
    : m_endpoint(std::move(endpoint)) {
    while (StringUtils::endsWith(m_endpoint, "/")) {
        m_endpoint.pop_back();
    }
}

std::vector<RemoteFile> ModelScopeDriver::listFiles(const ModelScopeSource& source) {
    auto url = m_endpoint + "/api/v1/models/" + source.modelId +
               "/repo/files?Revision=master&Recursive=true";
    auto response = m_client.get(url);
    if (!response.isSuccess()) {
        throw SizeProbeError("listing " + source.modelId + " failed: " + response.describe());
    }

    json body;
    try {
        body = json::parse(response.body);
    } catch (const json::exception& e) {
        throw SizeProbeError("listing " + source.modelId + " is not valid JSON: " + e.what());
    }

    json files;
    if (body.is_object() && body.contains("Data") && body["Data"].is_object()) {
        files = body["Data"].value("Files", json());
    }
    if (!files.is_array()) {
        throw SizeProbeError("listing " + source.modelId + " has no Data.Files");
    }

    std::vector<RemoteFile> result;
    for (const auto& entry : files) {
        if (entry.value("Type", "") == "tree") continue;

        auto path = entry.value("Path", "");
        if (path.empty()) continue;
        if (source.isSingleFile() && path != source.filePath) continue;

        RemoteFile file;
        file.relativePath = path;
        file.url = m_endpoint + "/api/v1/models/" + source.modelId +
                   "/repo?Revision=master&FilePath=" + utils::HttpClient::urlEncode(path);
        file.size = entry.value("Size", int64_t{0});
        file.sha256 = entry.value("Sha256", "");
        result.push_back(std::move(file));
    }

    if (source.isSingleFile() && result.empty()) {
        throw SizeProbeError(source.filePath + " not found in " + source.modelId);
    }
    return result;
}

int64_t ModelScopeDriver::probeSize(const WorkItem& item) {
    const auto& source = std::get<ModelScopeSource>(item.source);
    int64_t total = 0;
    for (const auto& file : listFiles(source)) {
        total += file.size.value_or(0);
    }
    return total;
}

std::vector<std::string> ModelScopeDriver::transfer(const WorkItem& item,
                                                    const fs::path& destination,
                                                    const ProgressCallback& onProgress,
                                                    const downloader::CancellationSignal& cancel) {
    const auto& source = std::get<ModelScopeSource>(item.source);

    std::vector<RemoteFile> files;
    try {
        files = listFiles(source);
    } catch (const SizeProbeError& e) {
        throw TransferError(e.what());
    }

    HttpTransfer http(m_client, {}, downloader::StorageLayout::partialSuffix(getKind()));
    for (const auto& file : files) {
        http.fetch(file, destination / file.relativePath, onProgress, cancel);
    }

    LOG_INFO("Fetched {} file(s) from model_scope/{}", files.size(), source.modelId);
    if (source.isSingleFile()) {
        return {(destination / source.filePath).string()};
    }
    return {destination.string()};
}

} // namespace modeld::core::sources
