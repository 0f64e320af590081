/**
 * @file test_sources.cpp
 * @brief Tests for source drivers that need no network
 */

#include <gtest/gtest.h>

#include "core/sources/HttpTransfer.hpp"
#include "core/sources/LocalPathDriver.hpp"
#include "core/sources/OllamaDriver.hpp"
#include "test_common.hpp"

using modeld::LocalPathSource;
using modeld::WorkItem;
using modeld::core::CancellationError;
using modeld::core::SizeProbeError;
using modeld::core::TransferError;
using modeld::core::downloader::CancellationSignal;
using modeld::core::sources::HttpTransfer;
using modeld::core::sources::LocalPathDriver;
using modeld::core::sources::OllamaReference;
using modeld::core::sources::RemoteFile;
using modeld::test::TempDir;
using modeld::test::writeBytes;
using modeld::test::writeFile;

namespace fs = std::filesystem;

namespace {

constexpr const char* kAbcSha256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
// Nothing listens here; any request fails at once
constexpr const char* kUnreachableUrl = "http://127.0.0.1:9/model.gguf";

WorkItem localItem(const fs::path& path) {
    WorkItem item;
    item.id = 3;
    item.source = LocalPathSource{path.string()};
    return item;
}

} // namespace

// =============================================================================
// OLLAMA REFERENCES
// =============================================================================

TEST(OllamaReference, DefaultsToLibraryAndLatest) {
    auto ref = OllamaReference::parse("llama3");
    EXPECT_EQ(ref.repository, "library/llama3");
    EXPECT_EQ(ref.tag, "latest");
}

TEST(OllamaReference, SplitsTag) {
    auto ref = OllamaReference::parse("qwen2:0.5b");
    EXPECT_EQ(ref.repository, "library/qwen2");
    EXPECT_EQ(ref.tag, "0.5b");
}

TEST(OllamaReference, KeepsNamespace) {
    auto ref = OllamaReference::parse("someone/custom-model:q4");
    EXPECT_EQ(ref.repository, "someone/custom-model");
    EXPECT_EQ(ref.tag, "q4");

    EXPECT_EQ(OllamaReference::parse("llama3:").tag, "latest");
}

// =============================================================================
// LOCAL PATHS
// =============================================================================

TEST(LocalPathDriver, ReportsSizeAndResolvesInPlace) {
    TempDir dir;
    writeBytes(dir / "model" / "a.bin", 30);
    writeBytes(dir / "model" / "b.bin", 12);
    LocalPathDriver driver;
    auto signal = CancellationSignal::create();
    auto item = localItem(dir / "model");

    EXPECT_EQ(driver.probeSize(item), 42);

    int64_t reported = 0;
    auto paths = driver.transfer(item, {}, [&](int64_t delta) { reported += delta; }, *signal);

    ASSERT_EQ(paths.size(), 1u);
    EXPECT_EQ(paths[0], (dir / "model").string());
    EXPECT_EQ(reported, 42);
    EXPECT_TRUE(fs::exists(dir / "model" / "a.bin"));
}

TEST(LocalPathDriver, MissingPathFails) {
    TempDir dir;
    LocalPathDriver driver;
    auto signal = CancellationSignal::create();
    auto item = localItem(dir / "absent.gguf");

    EXPECT_THROW(driver.probeSize(item), SizeProbeError);
    EXPECT_THROW(driver.transfer(item, {}, [](int64_t) {}, *signal), TransferError);
}

TEST(LocalPathDriver, HonoursCancellation) {
    TempDir dir;
    writeBytes(dir / "m.gguf", 5);
    LocalPathDriver driver;
    auto signal = CancellationSignal::create();
    signal->cancel();

    EXPECT_THROW(driver.transfer(localItem(dir / "m.gguf"), {}, [](int64_t) {}, *signal), CancellationError);
}

// =============================================================================
// HTTP TRANSFER
// =============================================================================

TEST(HttpTransfer, EncodesEachPathSegment) {
    EXPECT_EQ(modeld::core::sources::encodePath("dir/a b.gguf"), "dir/a%20b.gguf");
    EXPECT_EQ(modeld::core::sources::encodePath("model.gguf"), "model.gguf");
}

TEST(HttpTransfer, SkipsTargetThatIsAlreadyComplete) {
    TempDir dir;
    writeBytes(dir / "model.gguf", 16);
    modeld::utils::HttpClient client;
    HttpTransfer transfer(client, {}, ".incomplete");
    auto signal = CancellationSignal::create();

    RemoteFile file{kUnreachableUrl, "model.gguf", 16, ""};
    int64_t reported = 0;
    EXPECT_NO_THROW(transfer.fetch(file, dir / "model.gguf", [&](int64_t d) { reported += d; }, *signal));
    EXPECT_EQ(reported, 0);
}

TEST(HttpTransfer, WithdrawsBytesOfTargetWithWrongSize) {
    TempDir dir;
    writeBytes(dir / "model.gguf", 10);
    modeld::utils::HttpClient client;
    HttpTransfer transfer(client, {}, ".incomplete");
    auto signal = CancellationSignal::create();

    RemoteFile file{kUnreachableUrl, "model.gguf", 16, ""};
    std::vector<int64_t> deltas;
    EXPECT_THROW(transfer.fetch(file, dir / "model.gguf", [&](int64_t d) { deltas.push_back(d); }, *signal),
                 TransferError);

    ASSERT_FALSE(deltas.empty());
    EXPECT_EQ(deltas.front(), -10) << "bytes of the replaced file were part of the resume baseline";
    EXPECT_FALSE(fs::exists(dir / "model.gguf"));
}

TEST(HttpTransfer, WithdrawsBytesOfOversizedPartial) {
    TempDir dir;
    writeBytes(dir / "model.gguf.incomplete", 20);
    modeld::utils::HttpClient client;
    HttpTransfer transfer(client, {}, ".incomplete");
    auto signal = CancellationSignal::create();

    RemoteFile file{kUnreachableUrl, "model.gguf", 16, ""};
    std::vector<int64_t> deltas;
    EXPECT_THROW(transfer.fetch(file, dir / "model.gguf", [&](int64_t d) { deltas.push_back(d); }, *signal),
                 TransferError);

    ASSERT_FALSE(deltas.empty());
    EXPECT_EQ(deltas.front(), -20);
}

TEST(HttpTransfer, PromotesCompletePartialAfterChecksum) {
    TempDir dir;
    writeFile(dir / "model.gguf.incomplete", "abc");
    modeld::utils::HttpClient client;
    HttpTransfer transfer(client, {}, ".incomplete");
    auto signal = CancellationSignal::create();

    RemoteFile file{kUnreachableUrl, "model.gguf", 3, std::string("sha256:") + kAbcSha256};
    transfer.fetch(file, dir / "model.gguf", [](int64_t) {}, *signal);

    EXPECT_TRUE(fs::exists(dir / "model.gguf"));
    EXPECT_FALSE(fs::exists(dir / "model.gguf.incomplete"));
}

TEST(HttpTransfer, DiscardsPartialWithBadChecksum) {
    TempDir dir;
    writeFile(dir / "model.gguf.part", "abd");
    modeld::utils::HttpClient client;
    HttpTransfer transfer(client, {}, ".part");
    auto signal = CancellationSignal::create();

    RemoteFile file{kUnreachableUrl, "model.gguf", 3, kAbcSha256};
    EXPECT_THROW(transfer.fetch(file, dir / "model.gguf", [](int64_t) {}, *signal), TransferError);

    EXPECT_FALSE(fs::exists(dir / "model.gguf"));
    EXPECT_FALSE(fs::exists(dir / "model.gguf.part"));
}
