#include "chunkvault/metadata/sqlite_session_store.h"

#include <Poco/Data/SQLite/Connector.h>
#include <Poco/Data/SessionFactory.h>
#include <Poco/Data/Statement.h>

namespace {
using namespace Poco::Data::Keywords;
}

namespace chunkvault::metadata {

SqliteSessionStore::SqliteSessionStore(const std::string& db_path)
    : session_([](const std::string& path) {
          Poco::Data::SQLite::Connector::registerConnector();
          return Poco::Data::Session("SQLite", path);
      }(db_path)) {
    InitSchema();
}

void SqliteSessionStore::InitSchema() {
    session_ << "PRAGMA foreign_keys = ON", now;
    // FULL makes a committed transaction durable before SaveSession returns.
    session_ << "PRAGMA synchronous = FULL", now;

    session_ <<
            "CREATE TABLE IF NOT EXISTS upload_sessions ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "owner TEXT NOT NULL,"
            "filename TEXT NOT NULL,"
            "upload_id TEXT NOT NULL,"
            "total_size INTEGER NOT NULL,"
            "state TEXT NOT NULL,"
            "created_at INTEGER NOT NULL,"
            "last_activity_at INTEGER NOT NULL,"
            "UNIQUE(owner, filename)"
            ")",
        now;

    session_ <<
            "CREATE TABLE IF NOT EXISTS received_ranges ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "owner TEXT NOT NULL,"
            "filename TEXT NOT NULL,"
            "start_byte INTEGER NOT NULL,"
            "end_byte INTEGER NOT NULL,"
            "FOREIGN KEY(owner, filename) REFERENCES upload_sessions(owner, filename) "
            "ON DELETE CASCADE"
            ")",
        now;

    session_ <<
            "CREATE INDEX IF NOT EXISTS idx_received_ranges_session "
            "ON received_ranges(owner, filename)",
        now;
    session_ <<
            "CREATE INDEX IF NOT EXISTS idx_upload_sessions_activity "
            "ON upload_sessions(state, last_activity_at)",
        now;
}

core::Result<std::vector<UploadSession>> SqliteSessionStore::LoadSessions() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<UploadSession> sessions;
    try {
        UploadSession row;
        std::string state_value;
        Poco::Data::Statement select(session_);
        select <<
                "SELECT owner, filename, upload_id, total_size, state, created_at, "
                "last_activity_at FROM upload_sessions ORDER BY owner ASC, filename ASC",
            into(row.owner), into(row.filename), into(row.upload_id), into(row.total_size),
            into(state_value), into(row.created_at), into(row.last_activity_at), range(0, 1);

        while (!select.done()) {
            row = {};
            state_value.clear();
            select.execute();
            if (select.done() && row.owner.empty()) {
                break;
            }
            if (!row.owner.empty()) {
                row.state = ParseSessionState(state_value);
                sessions.push_back(row);
            }
        }

        for (auto& session : sessions) {
            auto ranges = LoadRanges(session.owner, session.filename);
            if (!ranges.ok()) {
                return ranges.error();
            }
            session.received_ranges = std::move(ranges.value());
        }
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }
    return sessions;
}

core::Result<std::vector<transfer::ByteRange>> SqliteSessionStore::LoadRanges(
    const std::string& owner, const std::string& filename) {
    std::vector<std::uint64_t> starts;
    std::vector<std::uint64_t> ends;
    std::string owner_value = owner;
    std::string filename_value = filename;
    Poco::Data::Statement select(session_);
    select <<
            "SELECT start_byte, end_byte FROM received_ranges "
            "WHERE owner = ? AND filename = ? ORDER BY start_byte ASC",
        use(owner_value), use(filename_value), into(starts), into(ends), now;

    std::vector<transfer::ByteRange> ranges;
    ranges.reserve(starts.size());
    for (std::size_t i = 0; i < starts.size() && i < ends.size(); ++i) {
        ranges.push_back(transfer::ByteRange{starts[i], ends[i]});
    }
    return ranges;
}

core::Result<void> SqliteSessionStore::SaveSession(const UploadSession& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        std::string owner_value = session.owner;
        std::string filename_value = session.filename;
        std::string upload_id_value = session.upload_id;
        std::uint64_t total_size_value = session.total_size;
        std::string state_value = SessionStateName(session.state);
        std::int64_t created_at_value = session.created_at;
        std::int64_t last_activity_value = session.last_activity_at;

        // Row and ranges become visible together or not at all.
        session_.begin();
        session_ <<
                "INSERT INTO upload_sessions(owner, filename, upload_id, total_size, state, "
                "created_at, last_activity_at) VALUES(?, ?, ?, ?, ?, ?, ?) "
                "ON CONFLICT(owner, filename) DO UPDATE SET "
                "upload_id=excluded.upload_id, total_size=excluded.total_size, "
                "state=excluded.state, created_at=excluded.created_at, "
                "last_activity_at=excluded.last_activity_at",
            use(owner_value), use(filename_value), use(upload_id_value), use(total_size_value),
            use(state_value), use(created_at_value), use(last_activity_value), now;

        session_ << "DELETE FROM received_ranges WHERE owner = ? AND filename = ?",
            use(owner_value), use(filename_value), now;

        for (const auto& range : session.received_ranges) {
            std::uint64_t start_value = range.start;
            std::uint64_t end_value = range.end;
            session_ <<
                    "INSERT INTO received_ranges(owner, filename, start_byte, end_byte) "
                    "VALUES(?, ?, ?, ?)",
                use(owner_value), use(filename_value), use(start_value), use(end_value), now;
        }
        session_.commit();
    } catch (const Poco::Exception& ex) {
        if (session_.isTransaction()) {
            session_.rollback();
        }
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }
    return core::Ok();
}

core::Result<void> SqliteSessionStore::DeleteSession(const std::string& owner,
                                                     const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        std::string owner_value = owner;
        std::string filename_value = filename;
        Poco::Data::Statement del(session_);
        del << "DELETE FROM upload_sessions WHERE owner = ? AND filename = ?", use(owner_value),
            use(filename_value), now;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }
    return core::Ok();
}

}  // namespace chunkvault::metadata
