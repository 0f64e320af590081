/**
 * LocalPathDriver.cpp
 */

#include "LocalPathDriver.hpp"
#include "../Errors.hpp"
#include "../../utils/FileUtils.hpp"

namespace modeld::core::sources {

using utils::FileUtils;

int64_t LocalPathDriver::probeSize(const WorkItem& item) {
    const auto& source = std::get<LocalPathSource>(item.source);
    std::error_code ec;
    if (source.path.empty() || !fs::exists(source.path, ec)) {
        throw SizeProbeError("local path '" + source.path + "' does not exist");
    }
    return FileUtils::getPathSize(source.path);
}

std::vector<std::string> LocalPathDriver::transfer(const WorkItem& item,
                                                   const fs::path& /*destination*/,
                                                   const ProgressCallback& onProgress,
                                                   const downloader::CancellationSignal& cancel) {
    const auto& source = std::get<LocalPathSource>(item.source);
    if (cancel.isCancelled()) {
        throw CancellationError();
    }

    std::error_code ec;
    if (source.path.empty() || !fs::exists(source.path, ec)) {
        throw TransferError("local path '" + source.path + "' does not exist");
    }

    onProgress(FileUtils::getPathSize(source.path));
    return {source.path};
}

} // namespace modeld::core::sources
