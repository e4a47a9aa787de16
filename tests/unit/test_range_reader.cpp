#include <filesystem>
#include <memory>
#include <string>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "chunkvault/ledger/progress_ledger.h"
#include "chunkvault/storage/artifact_store.h"
#include "chunkvault/transfer/range_reader.h"
#include "memory_session_store.h"

using chunkvault::core::ErrorCode;
using chunkvault::ledger::ProgressLedger;
using chunkvault::storage::ArtifactStore;
using chunkvault::testing::MemorySessionStore;
using chunkvault::transfer::RangeReader;
using chunkvault::transfer::RangeRequest;

namespace {

std::filesystem::path MakeTempDir() {
    const auto dir = std::filesystem::temp_directory_path() /
                     ("chunkvault_read_" + Poco::UUIDGenerator().createOne().toString());
    std::filesystem::create_directories(dir);
    return dir;
}

struct ReaderFixture {
    explicit ReaderFixture(const std::filesystem::path& dir)
        : ledger(std::make_shared<ProgressLedger>(std::make_shared<MemorySessionStore>())),
          artifacts(std::make_shared<ArtifactStore>((dir / "base").string(),
                                                    (dir / "tmp").string())),
          reader(ledger, artifacts) {}

    // Publishes content as a complete upload of deviceA.
    void Publish(const std::string& filename, const std::string& content) {
        auto opened = ledger->Open(filename, "deviceA", content.size());
        ASSERT_TRUE(opened.ok());
        ASSERT_TRUE(ledger->Record(filename, "deviceA", opened.value().upload_id,
                                   {0, content.size() - 1})
                        .ok());
        auto writer = artifacts->BeginWrite();
        ASSERT_TRUE(writer.ok());
        ASSERT_TRUE(writer.value()->Append(content.data(), content.size()).ok());
        ASSERT_TRUE(artifacts->Commit(*writer.value(), "deviceA", filename).ok());
        ASSERT_TRUE(ledger->MarkComplete(filename, "deviceA").ok());
    }

    std::shared_ptr<ProgressLedger> ledger;
    std::shared_ptr<ArtifactStore> artifacts;
    RangeReader reader;
};

}  // namespace

TEST(RangeReader, ParsesRangeHeaders) {
    auto closed = RangeReader::ParseRangeHeader("bytes=10-19");
    ASSERT_TRUE(closed.has_value());
    EXPECT_EQ(closed->start, 10u);
    ASSERT_TRUE(closed->end.has_value());
    EXPECT_EQ(*closed->end, 19u);

    auto open = RangeReader::ParseRangeHeader("bytes=500-");
    ASSERT_TRUE(open.has_value());
    EXPECT_EQ(open->start, 500u);
    EXPECT_FALSE(open->end.has_value());
}

TEST(RangeReader, RejectsMalformedHeaders) {
    EXPECT_FALSE(RangeReader::ParseRangeHeader("").has_value());
    EXPECT_FALSE(RangeReader::ParseRangeHeader("items=0-1").has_value());
    EXPECT_FALSE(RangeReader::ParseRangeHeader("bytes=-100").has_value());
    EXPECT_FALSE(RangeReader::ParseRangeHeader("bytes=0-1,5-6").has_value());
    EXPECT_FALSE(RangeReader::ParseRangeHeader("bytes=a-b").has_value());
    EXPECT_FALSE(RangeReader::ParseRangeHeader("bytes=99999999999999999999-").has_value());
}

TEST(RangeReader, ReadsWholeFileAndSlices) {
    const auto dir = MakeTempDir();
    {
        ReaderFixture f(dir);
        f.Publish("notes.txt", "0123456789");

        auto whole = f.reader.Read("notes.txt", "deviceA", std::nullopt);
        ASSERT_TRUE(whole.ok());
        EXPECT_EQ(whole.value().data, "0123456789");
        EXPECT_FALSE(whole.value().slice.partial);

        auto slice = f.reader.Read("notes.txt", "deviceA", RangeRequest{2, 5});
        ASSERT_TRUE(slice.ok());
        EXPECT_EQ(slice.value().data, "2345");
        EXPECT_TRUE(slice.value().slice.partial);
        EXPECT_EQ(RangeReader::ContentRange(slice.value().slice), "bytes 2-5/10");

        auto tail = f.reader.Read("notes.txt", "deviceA", RangeRequest{7, std::nullopt});
        ASSERT_TRUE(tail.ok());
        EXPECT_EQ(tail.value().data, "789");

        auto last_byte = f.reader.Read("notes.txt", "deviceA", RangeRequest{9, 9});
        ASSERT_TRUE(last_byte.ok());
        EXPECT_EQ(last_byte.value().data, "9");
    }
    std::filesystem::remove_all(dir);
}

TEST(RangeReader, RejectsUnsatisfiableRanges) {
    const auto dir = MakeTempDir();
    {
        ReaderFixture f(dir);
        f.Publish("notes.txt", "0123456789");

        EXPECT_EQ(f.reader.Read("notes.txt", "deviceA", RangeRequest{5, 10}).code(),
                  ErrorCode::kRangeNotSatisfiable);
        EXPECT_EQ(f.reader.Read("notes.txt", "deviceA", RangeRequest{10, std::nullopt}).code(),
                  ErrorCode::kRangeNotSatisfiable);
        EXPECT_EQ(f.reader.Read("notes.txt", "deviceA", RangeRequest{6, 3}).code(),
                  ErrorCode::kRangeNotSatisfiable);
    }
    std::filesystem::remove_all(dir);
}

TEST(RangeReader, IncompleteUploadIsNotReady) {
    const auto dir = MakeTempDir();
    {
        ReaderFixture f(dir);
        const auto id = f.ledger->Open("notes.txt", "deviceA", 10).value().upload_id;
        ASSERT_TRUE(f.ledger->Record("notes.txt", "deviceA", id, {0, 4}).ok());

        auto read = f.reader.Read("notes.txt", "deviceA", std::nullopt);
        ASSERT_FALSE(read.ok());
        EXPECT_EQ(read.code(), ErrorCode::kFileNotReady);

        EXPECT_EQ(f.reader.Read("other.txt", "deviceA", std::nullopt).code(),
                  ErrorCode::kNotFound);
        EXPECT_EQ(f.reader.Read("notes.txt", "deviceB", std::nullopt).code(),
                  ErrorCode::kNotFound);
    }
    std::filesystem::remove_all(dir);
}

TEST(RangeReader, HundredByteArtifactBoundaries) {
    const auto dir = MakeTempDir();
    {
        ReaderFixture f(dir);
        std::string content(100, '\0');
        for (std::size_t i = 0; i < content.size(); ++i) {
            content[i] = static_cast<char>(i);
        }
        f.Publish("data.bin", content);

        auto inner = f.reader.Read("data.bin", "deviceA", RangeRequest{10, 20});
        ASSERT_TRUE(inner.ok());
        EXPECT_EQ(inner.value().data.size(), 11u);
        EXPECT_EQ(inner.value().data, content.substr(10, 11));

        EXPECT_EQ(f.reader.Read("data.bin", "deviceA", RangeRequest{95, 150}).code(),
                  ErrorCode::kRangeNotSatisfiable);
    }
    std::filesystem::remove_all(dir);
}
