/**
 * @file test_work_item.cpp
 * @brief Tests for the work item wire format and change event parsing
 */

#include <gtest/gtest.h>

#include "core/models/WorkItem.hpp"
#include "core/records/HttpChangeFeed.hpp"

using modeld::ChangeType;
using modeld::HuggingFaceSource;
using modeld::LocalPathSource;
using modeld::ModelScopeSource;
using modeld::OllamaLibrarySource;
using modeld::SourceKind;
using modeld::WorkItem;
using modeld::WorkItemState;
using modeld::core::records::HttpChangeFeed;
using json = nlohmann::json;

// =============================================================================
// WIRE FORMAT
// =============================================================================

TEST(WorkItemJson, ParsesHuggingFaceRecord) {
    auto j = json::parse(R"({
        "id": 12,
        "worker_id": 3,
        "source": "huggingface",
        "huggingface_repo_id": "Qwen/Qwen2-0.5B-Instruct-GGUF",
        "huggingface_filename": "qwen2-0_5b-instruct-q4_0.gguf",
        "local_dir": null,
        "size": null,
        "download_progress": 12.5,
        "state": "downloading",
        "resolved_paths": [],
        "cleanup_on_delete": true
    })");

    auto item = j.get<WorkItem>();

    EXPECT_EQ(item.id, 12);
    ASSERT_TRUE(item.workerId.has_value());
    EXPECT_EQ(*item.workerId, 3);
    ASSERT_EQ(modeld::kindOf(item.source), SourceKind::HuggingFace);
    const auto& source = std::get<HuggingFaceSource>(item.source);
    EXPECT_EQ(source.repoId, "Qwen/Qwen2-0.5B-Instruct-GGUF");
    EXPECT_EQ(source.filename, "qwen2-0_5b-instruct-q4_0.gguf");
    EXPECT_FALSE(item.localDir.has_value());
    EXPECT_FALSE(item.size.has_value());
    EXPECT_DOUBLE_EQ(item.downloadProgress, 12.5);
    EXPECT_EQ(item.state, WorkItemState::Downloading);
    EXPECT_TRUE(item.cleanupOnDelete);
    EXPECT_TRUE(modeld::isSingleFile(item.source));
}

TEST(WorkItemJson, InfersSourceFromLocatorField) {
    auto item = json::parse(R"({"id": 1, "ollama_library_model_name": "llama3:8b"})").get<WorkItem>();

    ASSERT_EQ(modeld::kindOf(item.source), SourceKind::OllamaLibrary);
    EXPECT_EQ(std::get<OllamaLibrarySource>(item.source).modelName, "llama3:8b");
    EXPECT_EQ(item.state, WorkItemState::Downloading);
    EXPECT_FALSE(item.workerId.has_value());
    EXPECT_TRUE(item.resolvedPaths.empty());
}

TEST(WorkItemJson, RejectsRecordWithoutLocator) {
    EXPECT_THROW(json::parse(R"({"id": 1})").get<WorkItem>(), std::invalid_argument);
    EXPECT_THROW(json::parse(R"({"id": 1, "source": "ftp"})").get<WorkItem>(), std::invalid_argument);
}

TEST(WorkItemJson, WritesWireFieldsForEverySource) {
    WorkItem item;
    item.id = 5;
    item.workerId = 2;
    item.size = 2048;
    item.state = WorkItemState::Ready;
    item.resolvedPaths = {"/models/a.gguf"};

    item.source = ModelScopeSource{"qwen/Qwen2.5-0.5B", ""};
    json j = item;
    EXPECT_EQ(j["source"], "model_scope");
    EXPECT_EQ(j["model_scope_model_id"], "qwen/Qwen2.5-0.5B");
    EXPECT_TRUE(j["model_scope_file_path"].is_null());
    EXPECT_EQ(j["state"], "ready");
    EXPECT_EQ(j["size"], 2048);
    EXPECT_TRUE(j["state_message"].is_null());

    item.source = LocalPathSource{"/data/model.gguf"};
    j = item;
    EXPECT_EQ(j["source"], "local_path");
    EXPECT_EQ(j["local_path"], "/data/model.gguf");

    auto back = j.get<WorkItem>();
    EXPECT_EQ(std::get<LocalPathSource>(back.source).path, "/data/model.gguf");
    EXPECT_EQ(back.resolvedPaths, item.resolvedPaths);
}

TEST(WorkItemJson, ReadableSource) {
    WorkItem item;
    item.source = HuggingFaceSource{"org/model", "model.gguf"};
    EXPECT_EQ(item.readableSource(), "huggingface/org/model/model.gguf");

    item.source = OllamaLibrarySource{"llama3"};
    EXPECT_EQ(item.readableSource(), "ollama_library/llama3");
}

// =============================================================================
// CHANGE EVENTS
// =============================================================================

TEST(ChangeTypeParsing, AcceptsNamesAndNumbers) {
    EXPECT_EQ(modeld::changeTypeFromJson(json("CREATED")), ChangeType::Created);
    EXPECT_EQ(modeld::changeTypeFromJson(json("updated")), ChangeType::Updated);
    EXPECT_EQ(modeld::changeTypeFromJson(json(3)), ChangeType::Deleted);
    EXPECT_EQ(modeld::changeTypeFromJson(json(4)), ChangeType::Heartbeat);
    EXPECT_FALSE(modeld::changeTypeFromJson(json(9)).has_value());
    EXPECT_FALSE(modeld::changeTypeFromJson(json("RENAMED")).has_value());
}

TEST(ChangeFeedParsing, HeartbeatYieldsNoEvent) {
    EXPECT_FALSE(HttpChangeFeed::parseEvent(R"({"type": "HEARTBEAT"})").has_value());
}

TEST(ChangeFeedParsing, ParsesDeleteEvent) {
    auto event = HttpChangeFeed::parseEvent(
        R"({"type": "DELETED", "data": {"id": 4, "worker_id": 1, "local_path": "/data/m.gguf", "state": "ready"}})");

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->type, ChangeType::Deleted);
    EXPECT_EQ(event->item.id, 4);
    EXPECT_EQ(event->item.state, WorkItemState::Ready);
}

TEST(ChangeFeedParsing, RejectsMalformedLines) {
    EXPECT_ANY_THROW(HttpChangeFeed::parseEvent("not json"));
    EXPECT_ANY_THROW(HttpChangeFeed::parseEvent(R"({"data": {}})"));
    EXPECT_ANY_THROW(HttpChangeFeed::parseEvent(R"({"type": "CREATED"})"));
}
