#include <filesystem>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "chunkvault/metadata/sqlite_session_store.h"

using chunkvault::metadata::SessionState;
using chunkvault::metadata::SqliteSessionStore;
using chunkvault::metadata::UploadSession;

namespace {

std::filesystem::path MakeTempDbPath() {
    const auto name = "chunkvault_test_" + Poco::UUIDGenerator().createOne().toString() + ".db";
    return std::filesystem::temp_directory_path() / name;
}

UploadSession MakeSession(const std::string& owner, const std::string& filename) {
    UploadSession session;
    session.owner = owner;
    session.filename = filename;
    session.upload_id = "upload-1";
    session.total_size = 1000;
    session.state = SessionState::kInProgress;
    session.created_at = 1700000000000;
    session.last_activity_at = 1700000005000;
    session.received_ranges = {{0, 199}, {400, 599}};
    return session;
}

}  // namespace

TEST(SessionStore, SaveAndReload) {
    const auto db_path = MakeTempDbPath();

    {
        SqliteSessionStore store(db_path.string());
        ASSERT_TRUE(store.SaveSession(MakeSession("deviceA", "photo.jpg")).ok());
    }
    {
        SqliteSessionStore store(db_path.string());
        auto loaded = store.LoadSessions();
        ASSERT_TRUE(loaded.ok());
        ASSERT_EQ(loaded.value().size(), 1u);
        const auto& session = loaded.value()[0];
        EXPECT_EQ(session.owner, "deviceA");
        EXPECT_EQ(session.filename, "photo.jpg");
        EXPECT_EQ(session.upload_id, "upload-1");
        EXPECT_EQ(session.total_size, 1000u);
        EXPECT_EQ(session.state, SessionState::kInProgress);
        EXPECT_EQ(session.created_at, 1700000000000);
        EXPECT_EQ(session.last_activity_at, 1700000005000);
        ASSERT_EQ(session.received_ranges.size(), 2u);
        EXPECT_EQ(session.received_ranges[1].start, 400u);
        EXPECT_EQ(session.received_ranges[1].end, 599u);
    }

    std::filesystem::remove(db_path);
}

TEST(SessionStore, SaveReplacesRanges) {
    const auto db_path = MakeTempDbPath();

    {
        SqliteSessionStore store(db_path.string());
        auto session = MakeSession("deviceA", "photo.jpg");
        ASSERT_TRUE(store.SaveSession(session).ok());

        session.received_ranges = {{0, 999}};
        session.state = SessionState::kComplete;
        ASSERT_TRUE(store.SaveSession(session).ok());

        auto loaded = store.LoadSessions();
        ASSERT_TRUE(loaded.ok());
        ASSERT_EQ(loaded.value().size(), 1u);
        EXPECT_EQ(loaded.value()[0].state, SessionState::kComplete);
        ASSERT_EQ(loaded.value()[0].received_ranges.size(), 1u);
        EXPECT_EQ(loaded.value()[0].received_ranges[0].end, 999u);
    }

    std::filesystem::remove(db_path);
}

TEST(SessionStore, SameFilenameDifferentOwners) {
    const auto db_path = MakeTempDbPath();

    {
        SqliteSessionStore store(db_path.string());
        ASSERT_TRUE(store.SaveSession(MakeSession("deviceA", "photo.jpg")).ok());
        ASSERT_TRUE(store.SaveSession(MakeSession("deviceB", "photo.jpg")).ok());

        ASSERT_TRUE(store.DeleteSession("deviceA", "photo.jpg").ok());
        auto loaded = store.LoadSessions();
        ASSERT_TRUE(loaded.ok());
        ASSERT_EQ(loaded.value().size(), 1u);
        EXPECT_EQ(loaded.value()[0].owner, "deviceB");
        EXPECT_EQ(loaded.value()[0].received_ranges.size(), 2u);
    }

    std::filesystem::remove(db_path);
}

TEST(SessionStore, DeleteMissingSessionSucceeds) {
    const auto db_path = MakeTempDbPath();

    {
        SqliteSessionStore store(db_path.string());
        EXPECT_TRUE(store.DeleteSession("nobody", "nothing.bin").ok());
        auto loaded = store.LoadSessions();
        ASSERT_TRUE(loaded.ok());
        EXPECT_TRUE(loaded.value().empty());
    }

    std::filesystem::remove(db_path);
}
