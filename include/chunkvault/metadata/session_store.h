#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "chunkvault/core/error.h"
#include "chunkvault/core/result.h"
#include "chunkvault/transfer/chunk_codec.h"

namespace chunkvault::metadata {

/// @brief Lifecycle of an upload session. COMPLETE, FAILED and EXPIRED are terminal.
enum class SessionState {
    kPending,
    kInProgress,
    kComplete,
    kFailed,
    kExpired,
};

const char* SessionStateName(SessionState state);
/// @brief Parses the persisted lower-case name; unknown names map to kFailed.
SessionState ParseSessionState(const std::string& name);
bool IsTerminal(SessionState state);

/// @brief Durable record of one (owner, filename) upload.
struct UploadSession {
    std::string owner;
    std::string filename;
    std::string upload_id;
    std::uint64_t total_size{0};
    SessionState state{SessionState::kPending};
    std::int64_t created_at{0};
    std::int64_t last_activity_at{0};
    std::vector<transfer::ByteRange> received_ranges;
};

/// @brief Abstract persistence for upload sessions and their received ranges.
class SessionStore {
public:
    virtual ~SessionStore() = default;

    virtual core::Result<std::vector<UploadSession>> LoadSessions() = 0;
    /// Inserts or replaces the session row and its ranges atomically.
    virtual core::Result<void> SaveSession(const UploadSession& session) = 0;
    virtual core::Result<void> DeleteSession(const std::string& owner,
                                             const std::string& filename) = 0;
};

}  // namespace chunkvault::metadata
