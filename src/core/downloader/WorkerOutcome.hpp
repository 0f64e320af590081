#pragma once

/**
 * WorkerOutcome.hpp
 *
 * Everything a download execution hands back to the scheduler: the
 * structured outcome, plus the reporter interface used for the two
 * non-terminal writes a worker may request (probed size, progress).
 */

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace modeld::core::downloader {

using json = nlohmann::json;

enum class OutcomeKind {
    Success,
    Cancelled,
    TransferFailed,
    SizeProbeFailed
};

const char* toString(OutcomeKind kind);

struct WorkerOutcome {
    OutcomeKind kind{OutcomeKind::TransferFailed};
    std::vector<std::string> resolvedPaths;
    std::string message;

    static WorkerOutcome success(std::vector<std::string> paths) {
        return {OutcomeKind::Success, std::move(paths), ""};
    }
    static WorkerOutcome cancelled() {
        return {OutcomeKind::Cancelled, {}, "download cancelled"};
    }
    static WorkerOutcome transferFailed(std::string message) {
        return {OutcomeKind::TransferFailed, {}, std::move(message)};
    }
    static WorkerOutcome sizeProbeFailed(std::string message) {
        return {OutcomeKind::SizeProbeFailed, {}, std::move(message)};
    }
};

void to_json(json& j, const WorkerOutcome& outcome);
void from_json(const json& j, WorkerOutcome& outcome);

/**
 * Receives the writes a worker is allowed to make. The scheduler's
 * implementation forwards them to the record store; a forked worker's
 * implementation serializes them onto the pipe to its parent.
 */
class WorkerReporter {
public:
    virtual ~WorkerReporter() = default;

    virtual void reportSize(int64_t itemId, int64_t size) = 0;
    virtual void reportProgress(int64_t itemId, double percent) = 0;
};

} // namespace modeld::core::downloader
