/**
 * OllamaDriver.cpp
 */

#include "OllamaDriver.hpp"
#include "../Errors.hpp"
#include "../Logger.hpp"
#include "../downloader/StorageLayout.hpp"
#include "../../utils/StringUtils.hpp"

#include <nlohmann/json.hpp>
#include <utility>

namespace modeld::core::sources {

using json = nlohmann::json;
using utils::StringUtils;

OllamaReference OllamaReference::parse(const std::string& modelName) {
    OllamaReference ref;
    std::string name = modelName;
    ref.tag = "latest";

    // A ':' after the last '/' separates the tag
    auto slash = name.rfind('/');
    auto colon = name.rfind(':');
    if (colon != std::string::npos && (slash == std::string::npos || colon > slash)) {
        ref.tag = name.substr(colon + 1);
        name = name.substr(0, colon);
    }
    if (ref.tag.empty()) {
        ref.tag = "latest";
    }

    ref.repository = name.find('/') == std::string::npos ? "library/" + name : name;
    return ref;
}

OllamaDriver::OllamaDriver(std::string registry)
    : m_registry(std::move(registry)) {
    while (StringUtils::endsWith(m_registry, "/")) {
        m_registry.pop_back();
    }
}

OllamaModelLayer OllamaDriver::fetchModelLayer(const OllamaReference& ref) {
    auto url = m_registry + "/v2/" + ref.repository + "/manifests/" + ref.tag;

    utils::HttpOptions options;
    options.headers["Accept"] = "application/vnd.docker.distribution.manifest.v2+json";
    auto response = m_client.get(url, options);
    if (!response.isSuccess()) {
        throw SizeProbeError("manifest " + ref.repository + ":" + ref.tag + " unavailable: " + response.describe());
    }

    json manifest;
    try {
        manifest = json::parse(response.body);
    } catch (const json::exception& e) {
        throw SizeProbeError("manifest " + ref.repository + ":" + ref.tag + " is not valid JSON: " + e.what());
    }

    if (manifest.is_object() && manifest.contains("layers") && manifest["layers"].is_array()) {
        for (const auto& layer : manifest["layers"]) {
            if (layer.value("mediaType", "") == MODEL_MEDIA_TYPE) {
                return {layer.value("digest", ""), layer.value("size", int64_t{0})};
            }
        }
    }
    throw SizeProbeError("manifest " + ref.repository + ":" + ref.tag + " has no model layer");
}

int64_t OllamaDriver::probeSize(const WorkItem& item) {
    const auto& source = std::get<OllamaLibrarySource>(item.source);
    return fetchModelLayer(OllamaReference::parse(source.modelName)).size;
}

std::vector<std::string> OllamaDriver::transfer(const WorkItem& item,
                                                const fs::path& destination,
                                                const ProgressCallback& onProgress,
                                                const downloader::CancellationSignal& cancel) {
    const auto& source = std::get<OllamaLibrarySource>(item.source);
    auto ref = OllamaReference::parse(source.modelName);

    OllamaModelLayer layer;
    try {
        layer = fetchModelLayer(ref);
    } catch (const SizeProbeError& e) {
        throw TransferError(e.what());
    }
    if (layer.digest.empty()) {
        throw TransferError("model layer of " + source.modelName + " has no digest");
    }

    RemoteFile file;
    file.relativePath = StringUtils::sanitizeName(source.modelName);
    file.url = m_registry + "/v2/" + ref.repository + "/blobs/" + layer.digest;
    file.size = layer.size;
    file.sha256 = layer.digest;

    auto target = destination / file.relativePath;
    HttpTransfer http(m_client, {}, downloader::StorageLayout::partialSuffix(getKind()));
    http.fetch(file, target, onProgress, cancel);

    LOG_INFO("Fetched ollama_library/{} ({})", source.modelName, StringUtils::formatBytes(layer.size));
    return {target.string()};
}

} // namespace modeld::core::sources
