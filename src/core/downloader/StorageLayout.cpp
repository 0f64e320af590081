/**
 * StorageLayout.cpp
 */

#include "StorageLayout.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <utility>

namespace modeld::core::downloader {

using utils::FileUtils;
using utils::StringUtils;

namespace {

template<typename... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template<typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

fs::path appendSuffix(const fs::path& path, const std::string& suffix) {
    return fs::path(path.string() + suffix);
}

} // namespace

StorageLayout::StorageLayout(fs::path cacheDir)
    : m_cacheDir(std::move(cacheDir)) {
}

std::optional<fs::path> StorageLayout::destinationDir(const WorkItem& item) const {
    if (kindOf(item.source) == SourceKind::LocalPath) {
        return std::nullopt;
    }
    if (item.localDir) {
        return fs::path(*item.localDir);
    }

    return std::visit(Overloaded{
        [this](const HuggingFaceSource& s) -> std::optional<fs::path> {
            return m_cacheDir / "huggingface" / StringUtils::sanitizeName(s.repoId);
        },
        [this](const ModelScopeSource& s) -> std::optional<fs::path> {
            return m_cacheDir / "model_scope" / StringUtils::sanitizeName(s.modelId);
        },
        [this](const OllamaLibrarySource&) -> std::optional<fs::path> {
            return m_cacheDir / "ollama";
        },
        [](const LocalPathSource&) -> std::optional<fs::path> {
            return std::nullopt;
        },
    }, item.source);
}

std::optional<fs::path> StorageLayout::singleFileTarget(const WorkItem& item) const {
    auto dir = destinationDir(item);
    if (!dir || !isSingleFile(item.source)) {
        return std::nullopt;
    }

    return std::visit(Overloaded{
        [&dir](const HuggingFaceSource& s) -> std::optional<fs::path> {
            return *dir / s.filename;
        },
        [&dir](const ModelScopeSource& s) -> std::optional<fs::path> {
            return *dir / s.filePath;
        },
        [&dir](const OllamaLibrarySource& s) -> std::optional<fs::path> {
            return *dir / StringUtils::sanitizeName(s.modelName);
        },
        [](const LocalPathSource&) -> std::optional<fs::path> {
            return std::nullopt;
        },
    }, item.source);
}

std::string StorageLayout::partialSuffix(SourceKind kind) {
    switch (kind) {
        case SourceKind::HuggingFace:   return ".incomplete";
        case SourceKind::ModelScope:    return ".part";
        case SourceKind::OllamaLibrary: return ".part";
        case SourceKind::LocalPath:     return "";
    }
    return "";
}

int64_t StorageLayout::resumeOffset(const WorkItem& item) const {
    if (auto target = singleFileTarget(item)) {
        if (auto size = FileUtils::getFileSize(*target)) {
            return *size;
        }
        auto partial = appendSuffix(*target, partialSuffix(kindOf(item.source)));
        return FileUtils::getFileSize(partial).value_or(0);
    }

    if (auto dir = destinationDir(item)) {
        return FileUtils::getDirectorySize(*dir);
    }
    return 0;
}

std::vector<fs::path> StorageLayout::cleanupTargets(const WorkItem& item) const {
    if (kindOf(item.source) == SourceKind::LocalPath) {
        return {};
    }
    if (item.localDir) {
        return {fs::path(*item.localDir)};
    }

    // Derived directories are shared by every single-file item of the same
    // repository (and by all Ollama items), so only this item's files go.
    if (auto target = singleFileTarget(item)) {
        return {*target, appendSuffix(*target, partialSuffix(kindOf(item.source)))};
    }

    if (auto dir = destinationDir(item)) {
        return {*dir};
    }
    return {};
}

} // namespace modeld::core::downloader
