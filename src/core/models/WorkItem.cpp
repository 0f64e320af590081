/**
 * WorkItem.cpp
 *
 * JSON mapping for work items and change events.
 */

#include "WorkItem.hpp"
#include "../../utils/StringUtils.hpp"

#include <stdexcept>

namespace modeld {

namespace {

template<typename... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template<typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::string stringOr(const json& j, const char* key, const std::string& fallback = "") {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

template<typename T>
std::optional<T> optionalField(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

template<typename T>
void putOptional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

void putOptionalString(json& j, const char* key, const std::string& value) {
    if (value.empty()) {
        j[key] = nullptr;
    } else {
        j[key] = value;
    }
}

// Records created without an explicit "source" still carry exactly one
// locator field.
std::optional<SourceKind> inferKind(const json& j) {
    if (!stringOr(j, "huggingface_repo_id").empty()) return SourceKind::HuggingFace;
    if (!stringOr(j, "model_scope_model_id").empty()) return SourceKind::ModelScope;
    if (!stringOr(j, "ollama_library_model_name").empty()) return SourceKind::OllamaLibrary;
    if (!stringOr(j, "local_path").empty()) return SourceKind::LocalPath;
    return std::nullopt;
}

} // namespace

SourceKind kindOf(const SourceLocator& source) {
    return std::visit(Overloaded{
        [](const HuggingFaceSource&) { return SourceKind::HuggingFace; },
        [](const ModelScopeSource&) { return SourceKind::ModelScope; },
        [](const OllamaLibrarySource&) { return SourceKind::OllamaLibrary; },
        [](const LocalPathSource&) { return SourceKind::LocalPath; },
    }, source);
}

bool isSingleFile(const SourceLocator& source) {
    return std::visit([](const auto& s) { return s.isSingleFile(); }, source);
}

std::string toString(SourceKind kind) {
    switch (kind) {
        case SourceKind::HuggingFace:   return "huggingface";
        case SourceKind::ModelScope:    return "model_scope";
        case SourceKind::OllamaLibrary: return "ollama_library";
        case SourceKind::LocalPath:     return "local_path";
    }
    return "unknown";
}

std::optional<SourceKind> sourceKindFromString(const std::string& value) {
    auto lower = utils::StringUtils::toLower(value);
    if (lower == "huggingface" || lower == "hugging_face") return SourceKind::HuggingFace;
    if (lower == "model_scope" || lower == "modelscope") return SourceKind::ModelScope;
    if (lower == "ollama_library" || lower == "ollama") return SourceKind::OllamaLibrary;
    if (lower == "local_path") return SourceKind::LocalPath;
    return std::nullopt;
}

std::string toString(WorkItemState state) {
    switch (state) {
        case WorkItemState::Downloading: return "downloading";
        case WorkItemState::Ready:       return "ready";
        case WorkItemState::Error:       return "error";
    }
    return "error";
}

std::optional<WorkItemState> workItemStateFromString(const std::string& value) {
    auto lower = utils::StringUtils::toLower(value);
    if (lower == "downloading") return WorkItemState::Downloading;
    if (lower == "ready") return WorkItemState::Ready;
    if (lower == "error") return WorkItemState::Error;
    return std::nullopt;
}

std::string WorkItem::readableSource() const {
    return std::visit(Overloaded{
        [](const HuggingFaceSource& s) {
            return "huggingface/" + s.repoId + (s.filename.empty() ? "" : "/" + s.filename);
        },
        [](const ModelScopeSource& s) {
            return "model_scope/" + s.modelId + (s.filePath.empty() ? "" : "/" + s.filePath);
        },
        [](const OllamaLibrarySource& s) {
            return "ollama_library/" + s.modelName;
        },
        [](const LocalPathSource& s) {
            return "local_path/" + s.path;
        },
    }, source);
}

void to_json(json& j, const WorkItem& item) {
    j = json::object();
    j["id"] = item.id;
    putOptional(j, "worker_id", item.workerId);
    j["source"] = toString(kindOf(item.source));

    std::visit(Overloaded{
        [&j](const HuggingFaceSource& s) {
            j["huggingface_repo_id"] = s.repoId;
            putOptionalString(j, "huggingface_filename", s.filename);
        },
        [&j](const ModelScopeSource& s) {
            j["model_scope_model_id"] = s.modelId;
            putOptionalString(j, "model_scope_file_path", s.filePath);
        },
        [&j](const OllamaLibrarySource& s) {
            j["ollama_library_model_name"] = s.modelName;
        },
        [&j](const LocalPathSource& s) {
            j["local_path"] = s.path;
        },
    }, item.source);

    putOptional(j, "local_dir", item.localDir);
    putOptional(j, "size", item.size);
    j["download_progress"] = item.downloadProgress;
    j["state"] = toString(item.state);
    putOptional(j, "state_message", item.stateMessage);
    j["resolved_paths"] = item.resolvedPaths;
    j["cleanup_on_delete"] = item.cleanupOnDelete;
}

void from_json(const json& j, WorkItem& item) {
    if (!j.is_object()) {
        throw std::invalid_argument("work item payload is not an object");
    }

    item.id = j.at("id").get<int64_t>();
    item.workerId = optionalField<int64_t>(j, "worker_id");

    std::optional<SourceKind> kind;
    auto sourceName = stringOr(j, "source");
    if (!sourceName.empty()) {
        kind = sourceKindFromString(sourceName);
        if (!kind) {
            throw std::invalid_argument("unknown source kind '" + sourceName + "'");
        }
    } else {
        kind = inferKind(j);
        if (!kind) {
            throw std::invalid_argument("work item " + std::to_string(item.id) + " has no source locator");
        }
    }

    switch (*kind) {
        case SourceKind::HuggingFace:
            item.source = HuggingFaceSource{
                stringOr(j, "huggingface_repo_id"), stringOr(j, "huggingface_filename")};
            break;
        case SourceKind::ModelScope:
            item.source = ModelScopeSource{
                stringOr(j, "model_scope_model_id"), stringOr(j, "model_scope_file_path")};
            break;
        case SourceKind::OllamaLibrary:
            item.source = OllamaLibrarySource{stringOr(j, "ollama_library_model_name")};
            break;
        case SourceKind::LocalPath:
            item.source = LocalPathSource{stringOr(j, "local_path")};
            break;
    }

    item.localDir = optionalField<std::string>(j, "local_dir");
    if (item.localDir && item.localDir->empty()) {
        item.localDir.reset();
    }
    item.size = optionalField<int64_t>(j, "size");
    item.downloadProgress = optionalField<double>(j, "download_progress").value_or(0.0);

    auto state = workItemStateFromString(stringOr(j, "state", "downloading"));
    item.state = state.value_or(WorkItemState::Error);

    item.stateMessage = optionalField<std::string>(j, "state_message");
    item.resolvedPaths = optionalField<std::vector<std::string>>(j, "resolved_paths")
        .value_or(std::vector<std::string>{});
    item.cleanupOnDelete = optionalField<bool>(j, "cleanup_on_delete").value_or(false);
}

std::string toString(ChangeType type) {
    switch (type) {
        case ChangeType::Created:   return "CREATED";
        case ChangeType::Updated:   return "UPDATED";
        case ChangeType::Deleted:   return "DELETED";
        case ChangeType::Heartbeat: return "HEARTBEAT";
    }
    return "UNKNOWN";
}

std::optional<ChangeType> changeTypeFromJson(const json& value) {
    if (value.is_number_integer()) {
        switch (value.get<int>()) {
            case 1: return ChangeType::Created;
            case 2: return ChangeType::Updated;
            case 3: return ChangeType::Deleted;
            case 4: return ChangeType::Heartbeat;
            default: return std::nullopt;
        }
    }
    if (value.is_string()) {
        auto upper = utils::StringUtils::toUpper(value.get<std::string>());
        if (upper == "CREATED") return ChangeType::Created;
        if (upper == "UPDATED") return ChangeType::Updated;
        if (upper == "DELETED") return ChangeType::Deleted;
        if (upper == "HEARTBEAT") return ChangeType::Heartbeat;
    }
    return std::nullopt;
}

} // namespace modeld
