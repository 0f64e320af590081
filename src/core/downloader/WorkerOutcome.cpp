/**
 * WorkerOutcome.cpp
 */

#include "WorkerOutcome.hpp"

#include <stdexcept>

namespace modeld::core::downloader {

const char* toString(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::Success:         return "success";
        case OutcomeKind::Cancelled:       return "cancelled";
        case OutcomeKind::TransferFailed:  return "transfer_failed";
        case OutcomeKind::SizeProbeFailed: return "size_probe_failed";
    }
    return "unknown";
}

void to_json(json& j, const WorkerOutcome& outcome) {
    j = json{
        {"kind", toString(outcome.kind)},
        {"resolved_paths", outcome.resolvedPaths},
        {"message", outcome.message}
    };
}

void from_json(const json& j, WorkerOutcome& outcome) {
    auto kind = j.at("kind").get<std::string>();
    if (kind == "success") {
        outcome.kind = OutcomeKind::Success;
    } else if (kind == "cancelled") {
        outcome.kind = OutcomeKind::Cancelled;
    } else if (kind == "transfer_failed") {
        outcome.kind = OutcomeKind::TransferFailed;
    } else if (kind == "size_probe_failed") {
        outcome.kind = OutcomeKind::SizeProbeFailed;
    } else {
        throw std::invalid_argument("unknown outcome kind '" + kind + "'");
    }
    outcome.resolvedPaths = j.value("resolved_paths", std::vector<std::string>{});
    outcome.message = j.value("message", std::string{});
}

} // namespace modeld::core::downloader
