#pragma once

#include <mutex>
#include <string>

#include <Poco/Data/Session.h>

#include "chunkvault/metadata/session_store.h"

namespace chunkvault::metadata {

/// @brief SQLite-backed session store for single-node mode.
class SqliteSessionStore : public SessionStore {
public:
    explicit SqliteSessionStore(const std::string& db_path);

    core::Result<std::vector<UploadSession>> LoadSessions() override;
    core::Result<void> SaveSession(const UploadSession& session) override;
    core::Result<void> DeleteSession(const std::string& owner,
                                     const std::string& filename) override;

private:
    void InitSchema();
    core::Result<std::vector<transfer::ByteRange>> LoadRanges(const std::string& owner,
                                                              const std::string& filename);

    // Poco::Data::Session is not safe for concurrent use.
    std::mutex mutex_;
    Poco::Data::Session session_;
};

}  // namespace chunkvault::metadata
