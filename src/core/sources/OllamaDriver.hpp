#pragma once

/**
 * OllamaDriver.hpp
 *
 * Ollama library models, pulled from the registry as a single model blob.
 *   manifest: {registry}/v2/library/{name}/manifests/{tag}
 *   blob:     {registry}/v2/library/{name}/blobs/{digest}
 */

#include "SourceDriver.hpp"
#include "HttpTransfer.hpp"
#include "../../utils/HttpClient.hpp"

#include <string>
#include <vector>

namespace modeld::core::sources {

struct OllamaReference {
    std::string repository;     // "library/llama3" or "namespace/model"
    std::string tag;            // defaults to "latest"

    static OllamaReference parse(const std::string& modelName);
};

struct OllamaModelLayer {
    std::string digest;
    int64_t size{0};
};

class OllamaDriver : public SourceDriver {
public:
    explicit OllamaDriver(std::string registry);

    SourceKind getKind() const override { return SourceKind::OllamaLibrary; }

    int64_t probeSize(const WorkItem& item) override;

    std::vector<std::string> transfer(const WorkItem& item,
                                      const fs::path& destination,
                                      const ProgressCallback& onProgress,
                                      const downloader::CancellationSignal& cancel) override;

    static constexpr const char* MODEL_MEDIA_TYPE = "application/vnd.ollama.image.model";

private:
    OllamaModelLayer fetchModelLayer(const OllamaReference& ref);

    std::string m_registry;
    utils::HttpClient m_client;
};

} // namespace modeld::core::sources
