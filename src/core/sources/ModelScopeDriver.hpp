#pragma once

/**
 * ModelScopeDriver.hpp
 *
 * ModelScope model repositories and single files.
 *   listing:  {endpoint}/api/v1/models/{id}/repo/files?Revision=master&Recursive=true
 *   file:     {endpoint}/api/v1/models/{id}/repo?Revision=master&FilePath={path}
 */

#include "SourceDriver.hpp"
#include "HttpTransfer.hpp"
#include "../../utils/HttpClient.hpp"

#include <string>
#include <vector>

namespace modeld::core::sources {

class ModelScopeDriver : public SourceDriver {
public:
    explicit ModelScopeDriver(std::string endpoint);

    SourceKind getKind() const override { return SourceKind::ModelScope; }

    int64_t probeSize(const WorkItem& item) override;

    std::vector<std::string> transfer(const WorkItem& item,
                                      const fs::path& destination,
                                      const ProgressCallback& onProgress,
                                      const downloader::CancellationSignal& cancel) override;

private:
    std::vector<RemoteFile> listFiles(const ModelScopeSource& source);

    std::string m_endpoint;
    utils::HttpClient m_client;
};

} // namespace modeld::core::sources
