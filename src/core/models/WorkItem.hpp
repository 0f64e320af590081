// modeld - Data Models
// Work items mirrored from the remote model-file record store

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace modeld {

using json = nlohmann::json;

//=============================================================================
// Source locators
//=============================================================================

enum class SourceKind {
    HuggingFace,
    ModelScope,
    OllamaLibrary,
    LocalPath
};

struct HuggingFaceSource {
    std::string repoId;
    std::string filename;   // empty = whole repository

    bool isSingleFile() const { return !filename.empty(); }
};

struct ModelScopeSource {
    std::string modelId;
    std::string filePath;   // empty = whole repository

    bool isSingleFile() const { return !filePath.empty(); }
};

struct OllamaLibrarySource {
    std::string modelName;  // name[:tag]

    bool isSingleFile() const { return true; }
};

struct LocalPathSource {
    std::string path;

    bool isSingleFile() const { return false; }
};

using SourceLocator = std::variant<
    HuggingFaceSource,
    ModelScopeSource,
    OllamaLibrarySource,
    LocalPathSource
>;

SourceKind kindOf(const SourceLocator& source);
std::string toString(SourceKind kind);
std::optional<SourceKind> sourceKindFromString(const std::string& value);
bool isSingleFile(const SourceLocator& source);

//=============================================================================
// Work item
//=============================================================================

enum class WorkItemState {
    Downloading,
    Ready,
    Error
};

std::string toString(WorkItemState state);
std::optional<WorkItemState> workItemStateFromString(const std::string& value);

struct WorkItem {
    int64_t id{0};
    std::optional<int64_t> workerId;
    SourceLocator source;
    std::optional<std::string> localDir;
    std::optional<int64_t> size;
    double downloadProgress{0.0};
    WorkItemState state{WorkItemState::Downloading};
    std::optional<std::string> stateMessage;
    std::vector<std::string> resolvedPaths;
    bool cleanupOnDelete{false};

    /**
     * Short label for logs, e.g. "huggingface/Qwen/Qwen2-0.5B/model.gguf"
     */
    std::string readableSource() const;
};

// Field names follow the record store's wire format.
void to_json(json& j, const WorkItem& item);
void from_json(const json& j, WorkItem& item);

//=============================================================================
// Change events
//=============================================================================

enum class ChangeType {
    Created,
    Updated,
    Deleted,
    Heartbeat
};

std::string toString(ChangeType type);
std::optional<ChangeType> changeTypeFromJson(const json& value);

struct ChangeEvent {
    ChangeType type{ChangeType::Heartbeat};
    WorkItem item;
};

} // namespace modeld
