#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "chunkvault/ledger/progress_ledger.h"
#include "chunkvault/storage/artifact_store.h"
#include "chunkvault/storage/local_chunk_store.h"
#include "chunkvault/transfer/assembler.h"
#include "chunkvault/transfer/chunk_codec.h"
#include "chunkvault/transfer/range_reader.h"
#include "chunkvault/transfer/transfer_service.h"
#include "memory_session_store.h"

using chunkvault::core::ErrorCode;
using chunkvault::ledger::ProgressLedger;
using chunkvault::ledger::SessionState;
using chunkvault::storage::ArtifactStore;
using chunkvault::storage::LocalChunkStore;
using chunkvault::testing::MemorySessionStore;
using chunkvault::transfer::Assembler;
using chunkvault::transfer::EncodeChunk;
using chunkvault::transfer::RangeReader;
using chunkvault::transfer::RangeRequest;
using chunkvault::transfer::TransferService;

namespace {

std::filesystem::path MakeTempDir() {
    const auto dir = std::filesystem::temp_directory_path() /
                     ("chunkvault_svc_" + Poco::UUIDGenerator().createOne().toString());
    std::filesystem::create_directories(dir);
    return dir;
}

std::string MakeContent(std::size_t size) {
    std::string content;
    content.reserve(size);
    for (std::size_t i = 0; i < size; ++i) {
        content.push_back(static_cast<char>((i * 31 + 7) % 256));
    }
    return content;
}

struct ServiceFixture {
    explicit ServiceFixture(const std::filesystem::path& dir)
        : store(std::make_shared<MemorySessionStore>()),
          ledger(std::make_shared<ProgressLedger>(store)),
          chunks(std::make_shared<LocalChunkStore>((dir / "tmp" / "chunks").string(), ledger)),
          artifacts(std::make_shared<ArtifactStore>(dir.string(), (dir / "tmp").string())) {
        Rebuild();
    }

    void Rebuild() {
        auto assembler = std::make_shared<Assembler>(ledger, chunks, artifacts);
        auto reader = std::make_shared<RangeReader>(ledger, artifacts);
        service = std::make_shared<TransferService>(ledger, chunks, artifacts, assembler, reader);
    }

    std::string Holding(const std::string& filename, const std::string& owner) const {
        return chunks->HoldingPath(filename, owner,
                                   ledger->Status(filename, owner).value().upload_id);
    }

    std::shared_ptr<MemorySessionStore> store;
    std::shared_ptr<ProgressLedger> ledger;
    std::shared_ptr<LocalChunkStore> chunks;
    std::shared_ptr<ArtifactStore> artifacts;
    std::shared_ptr<TransferService> service;
};

}  // namespace

TEST(TransferService, TwoChunkUploadAssemblesFile) {
    const auto dir = MakeTempDir();
    {
        ServiceFixture f(dir);
        const auto content = MakeContent(1000);

        auto first = f.service->UploadChunk("deviceA", "photo.jpg",
                                            EncodeChunk(0, content.substr(0, 500)), 1000);
        ASSERT_TRUE(first.ok());
        EXPECT_EQ(first.value().session.bytes_received, 500u);
        EXPECT_EQ(first.value().session.state, SessionState::kInProgress);
        EXPECT_FALSE(first.value().assembled);

        auto second = f.service->UploadChunk("deviceA", "photo.jpg",
                                             EncodeChunk(500, content.substr(500)), 1000);
        ASSERT_TRUE(second.ok());
        EXPECT_TRUE(second.value().assembled);
        EXPECT_FALSE(second.value().etag.empty());
        EXPECT_EQ(second.value().session.state, SessionState::kComplete);
        EXPECT_EQ(second.value().session.bytes_received, 1000u);

        auto read = f.service->Download("deviceA", "photo.jpg", std::nullopt);
        ASSERT_TRUE(read.ok());
        EXPECT_EQ(read.value().data.size(), 1000u);
        EXPECT_EQ(read.value().data, content);
    }
    std::filesystem::remove_all(dir);
}

TEST(TransferService, OutOfOrderChunksWithDuplicates) {
    const auto dir = MakeTempDir();
    {
        ServiceFixture f(dir);
        const auto content = MakeContent(1000);
        // Only the first chunk declares the size.
        std::optional<std::uint64_t> total_size = 1000;
        for (std::uint64_t start : {800u, 200u, 0u, 200u, 600u, 400u}) {
            auto receipt = f.service->UploadChunk(
                "deviceA", "photo.jpg", EncodeChunk(start, content.substr(start, 200)), total_size);
            ASSERT_TRUE(receipt.ok()) << receipt.error().message;
            total_size.reset();
        }
        auto status = f.service->Status("deviceA", "photo.jpg");
        ASSERT_TRUE(status.ok());
        EXPECT_EQ(status.value().state, SessionState::kComplete);

        auto slice = f.service->Download("deviceA", "photo.jpg", RangeRequest{100, 299});
        ASSERT_TRUE(slice.ok());
        EXPECT_EQ(slice.value().data, content.substr(100, 200));
    }
    std::filesystem::remove_all(dir);
}

TEST(TransferService, CorruptChunkLeavesSessionUntouched) {
    const auto dir = MakeTempDir();
    {
        ServiceFixture f(dir);
        const auto content = MakeContent(100);
        ASSERT_TRUE(
            f.service->UploadChunk("deviceA", "data.bin", EncodeChunk(0, content.substr(0, 50)), 100)
                .ok());

        auto body = EncodeChunk(50, content.substr(50));
        body[20] = static_cast<char>(body[20] + 1);
        auto rejected = f.service->UploadChunk("deviceA", "data.bin", body, std::nullopt);
        ASSERT_FALSE(rejected.ok());
        EXPECT_EQ(rejected.code(), ErrorCode::kChecksumMismatch);

        auto status = f.service->Status("deviceA", "data.bin").value();
        EXPECT_EQ(status.bytes_received, 50u);
        EXPECT_EQ(status.next_expected_byte, 50u);
        EXPECT_EQ(status.state, SessionState::kInProgress);

        auto malformed = f.service->UploadChunk("deviceA", "data.bin", "short", std::nullopt);
        ASSERT_FALSE(malformed.ok());
        EXPECT_EQ(malformed.code(), ErrorCode::kMalformedHeader);
    }
    std::filesystem::remove_all(dir);
}

TEST(TransferService, RejectsChunksBeyondDeclaredSize) {
    const auto dir = MakeTempDir();
    {
        ServiceFixture f(dir);
        auto beyond = f.service->UploadChunk("deviceA", "data.bin", EncodeChunk(90, MakeContent(20)),
                                             100);
        ASSERT_FALSE(beyond.ok());
        EXPECT_EQ(beyond.code(), ErrorCode::kOutOfBounds);
        EXPECT_EQ(f.service->Status("deviceA", "data.bin").value().bytes_received, 0u);
        EXPECT_FALSE(std::filesystem::exists(f.Holding("data.bin", "deviceA")));
    }
    std::filesystem::remove_all(dir);
}

TEST(TransferService, FirstChunkNeedsTotalSize) {
    const auto dir = MakeTempDir();
    {
        ServiceFixture f(dir);
        auto rejected = f.service->UploadChunk("deviceA", "data.bin", EncodeChunk(0, "abc"),
                                               std::nullopt);
        ASSERT_FALSE(rejected.ok());
        EXPECT_EQ(rejected.code(), ErrorCode::kInvalidArgument);

        auto conflict_setup =
            f.service->UploadChunk("deviceA", "data.bin", EncodeChunk(0, "abc"), 10);
        ASSERT_TRUE(conflict_setup.ok());
        auto conflict = f.service->UploadChunk("deviceA", "data.bin", EncodeChunk(3, "def"), 20);
        ASSERT_FALSE(conflict.ok());
        EXPECT_EQ(conflict.code(), ErrorCode::kSizeConflict);
    }
    std::filesystem::remove_all(dir);
}

TEST(TransferService, RejectsUnsafeFilenames) {
    const auto dir = MakeTempDir();
    {
        ServiceFixture f(dir);
        auto rejected = f.service->UploadChunk("deviceA", "..", EncodeChunk(0, "abc"), 3);
        ASSERT_FALSE(rejected.ok());
        EXPECT_EQ(rejected.code(), ErrorCode::kInvalidArgument);
    }
    std::filesystem::remove_all(dir);
}

TEST(TransferService, ChunkAfterCompletionIsClosed) {
    const auto dir = MakeTempDir();
    {
        ServiceFixture f(dir);
        ASSERT_TRUE(f.service->UploadChunk("deviceA", "a.txt", EncodeChunk(0, "abcd"), 4).ok());
        auto late = f.service->UploadChunk("deviceA", "a.txt", EncodeChunk(0, "abcd"), 4);
        ASSERT_FALSE(late.ok());
        EXPECT_EQ(late.code(), ErrorCode::kSessionClosed);
        EXPECT_EQ(f.service->Download("deviceA", "a.txt", std::nullopt).value().data, "abcd");
    }
    std::filesystem::remove_all(dir);
}

TEST(TransferService, DownloadBeforeCompletionIsNotReady) {
    const auto dir = MakeTempDir();
    {
        ServiceFixture f(dir);
        ASSERT_TRUE(f.service->UploadChunk("deviceA", "a.txt", EncodeChunk(0, "ab"), 4).ok());
        EXPECT_EQ(f.service->Download("deviceA", "a.txt", std::nullopt).code(),
                  ErrorCode::kFileNotReady);
        EXPECT_EQ(f.service->Download("deviceB", "a.txt", std::nullopt).code(),
                  ErrorCode::kNotFound);
    }
    std::filesystem::remove_all(dir);
}

TEST(TransferService, ListIsScopedToOwner) {
    const auto dir = MakeTempDir();
    {
        ServiceFixture f(dir);
        ASSERT_TRUE(f.service->UploadChunk("deviceA", "a.txt", EncodeChunk(0, "ab"), 4).ok());
        ASSERT_TRUE(f.service->UploadChunk("deviceA", "b.txt", EncodeChunk(0, "ab"), 2).ok());
        ASSERT_TRUE(f.service->UploadChunk("deviceB", "a.txt", EncodeChunk(0, "ab"), 2).ok());
        EXPECT_EQ(f.service->List("deviceA").size(), 2u);
        EXPECT_EQ(f.service->List("deviceB").size(), 1u);
    }
    std::filesystem::remove_all(dir);
}

TEST(TransferService, RemoveDeletesArtifactAndSession) {
    const auto dir = MakeTempDir();
    {
        ServiceFixture f(dir);
        ASSERT_TRUE(f.service->UploadChunk("deviceA", "a.txt", EncodeChunk(0, "abcd"), 4).ok());
        ASSERT_TRUE(f.service->UploadChunk("deviceA", "b.txt", EncodeChunk(0, "ab"), 4).ok());
        const auto b_holding = f.Holding("b.txt", "deviceA");
        ASSERT_TRUE(std::filesystem::exists(b_holding));

        ASSERT_TRUE(f.service->Remove("deviceA", "a.txt").ok());
        EXPECT_EQ(f.service->Status("deviceA", "a.txt").code(), ErrorCode::kNotFound);
        EXPECT_EQ(f.artifacts->Stat("deviceA", "a.txt").code(), ErrorCode::kNotFound);

        ASSERT_TRUE(f.service->Remove("deviceA", "b.txt").ok());
        EXPECT_FALSE(std::filesystem::exists(b_holding));

        EXPECT_EQ(f.service->Remove("deviceA", "a.txt").code(), ErrorCode::kNotFound);
    }
    std::filesystem::remove_all(dir);
}

TEST(TransferService, RecoverFinalizesFullyCoveredSessions) {
    const auto dir = MakeTempDir();
    {
        ServiceFixture f(dir);
        // Simulate a crash between the last Record and assembly.
        const auto id = f.ledger->Open("a.txt", "deviceA", 4).value().upload_id;
        ASSERT_TRUE(f.chunks->WriteChunk("a.txt", "deviceA", id, {0, 3}, "wxyz").ok());
        ASSERT_TRUE(f.ledger->Record("a.txt", "deviceA", id, {0, 3}).ok());
        // Holdings of an upload that no longer exists.
        ASSERT_TRUE(f.chunks->WriteChunk("a.txt", "deviceA", "replaced-upload", {0, 1}, "ab").ok());
        std::ofstream(std::filesystem::path(f.artifacts->temp_path()) / "stale") << "junk";

        auto restored = std::make_shared<ProgressLedger>(f.store);
        ASSERT_TRUE(restored->Load().ok());
        f.ledger = restored;
        f.chunks = std::make_shared<LocalChunkStore>(f.chunks->root(), restored);
        f.Rebuild();

        auto report = f.service->Recover();
        EXPECT_EQ(report.finalized, 1u);
        EXPECT_EQ(report.discarded_temps, 1u);
        EXPECT_EQ(report.released, 1u);
        EXPECT_EQ(report.faults, 0u);
        EXPECT_FALSE(std::filesystem::exists(
            f.chunks->HoldingPath("a.txt", "deviceA", "replaced-upload")));
        EXPECT_EQ(f.service->Status("deviceA", "a.txt").value().state, SessionState::kComplete);
        EXPECT_EQ(f.service->Download("deviceA", "a.txt", std::nullopt).value().data, "wxyz");
    }
    std::filesystem::remove_all(dir);
}

TEST(TransferService, ReopenAfterExpiryKeepsNewUploadIntact) {
    const auto dir = MakeTempDir();
    {
        ServiceFixture f(dir);
        const auto content = MakeContent(1000);
        ASSERT_TRUE(
            f.service->UploadChunk("deviceA", "photo.jpg", EncodeChunk(0, content.substr(0, 500)),
                                   1000)
                .ok());
        const auto expired = f.ledger->Status("photo.jpg", "deviceA").value();
        ASSERT_TRUE(f.ledger
                        ->ExpireIfIdle("photo.jpg", "deviceA", expired.upload_id,
                                       expired.last_activity_at + 1)
                        .value());

        // The device starts over before the expired holdings are released.
        auto reopened = f.service->UploadChunk("deviceA", "photo.jpg",
                                               EncodeChunk(0, content.substr(0, 500)), 1000);
        ASSERT_TRUE(reopened.ok());
        EXPECT_NE(reopened.value().session.upload_id, expired.upload_id);
        ASSERT_TRUE(f.chunks->Purge("photo.jpg", "deviceA", expired.upload_id).ok());

        auto last = f.service->UploadChunk("deviceA", "photo.jpg",
                                           EncodeChunk(500, content.substr(500)), std::nullopt);
        ASSERT_TRUE(last.ok());
        EXPECT_TRUE(last.value().assembled);
        auto read = f.service->Download("deviceA", "photo.jpg", std::nullopt);
        ASSERT_TRUE(read.ok());
        EXPECT_EQ(read.value().data, content);
    }
    std::filesystem::remove_all(dir);
}

TEST(TransferService, RemoveSparesUploadThatReplacedIt) {
    const auto dir = MakeTempDir();
    {
        ServiceFixture f(dir);
        ASSERT_TRUE(f.service->UploadChunk("deviceA", "a.txt", EncodeChunk(0, "ab"), 4).ok());
        const auto first_holding = f.Holding("a.txt", "deviceA");
        ASSERT_TRUE(f.service->Remove("deviceA", "a.txt").ok());
        EXPECT_FALSE(std::filesystem::exists(first_holding));

        ASSERT_TRUE(f.service->UploadChunk("deviceA", "a.txt", EncodeChunk(0, "wx"), 4).ok());
        const auto second_holding = f.Holding("a.txt", "deviceA");
        EXPECT_NE(second_holding, first_holding);
        ASSERT_TRUE(f.service->UploadChunk("deviceA", "a.txt", EncodeChunk(2, "yz"), std::nullopt)
                        .ok());
        EXPECT_EQ(f.service->Download("deviceA", "a.txt", std::nullopt).value().data, "wxyz");
    }
    std::filesystem::remove_all(dir);
}
