#pragma once

/**
 * HuggingFaceDriver.hpp
 *
 * Hugging Face Hub repositories and single files.
 *   listing:  {endpoint}/api/models/{repo}/tree/main?recursive=true
 *   file:     {endpoint}/{repo}/resolve/main/{path}
 */

#include "SourceDriver.hpp"
#include "HttpTransfer.hpp"
#include "../../utils/HttpClient.hpp"

#include <string>
#include <vector>

namespace modeld::core::sources {

class HuggingFaceDriver : public SourceDriver {
public:
    HuggingFaceDriver(std::string endpoint, std::string token);

    SourceKind getKind() const override { return SourceKind::HuggingFace; }

    int64_t probeSize(const WorkItem& item) override;

    std::vector<std::string> transfer(const WorkItem& item,
                                      const fs::path& destination,
                                      const ProgressCallback& onProgress,
                                      const downloader::CancellationSignal& cancel) override;

private:
    /**
     * Files to fetch for this item; a single-file item yields one entry
     */
    std::vector<RemoteFile> listFiles(const HuggingFaceSource& source);

    utils::HttpOptions requestOptions() const;

    std::string m_endpoint;
    std::string m_token;
    utils::HttpClient m_client;
};

} // namespace modeld::core::sources
