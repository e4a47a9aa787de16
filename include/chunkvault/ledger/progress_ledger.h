#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "chunkvault/core/result.h"
#include "chunkvault/ledger/range_set.h"
#include "chunkvault/metadata/session_store.h"

namespace chunkvault::ledger {

using metadata::SessionState;

/// @brief Read-only view of a session handed out to callers.
struct SessionSnapshot {
    std::string owner;
    std::string filename;
    std::string upload_id;
    std::uint64_t total_size{0};
    std::uint64_t bytes_received{0};
    std::uint64_t next_expected_byte{0};
    std::vector<ByteRange> received_ranges;
    std::vector<ByteRange> missing_ranges;
    SessionState state{SessionState::kPending};
    std::int64_t created_at{0};
    std::int64_t last_activity_at{0};
};

/// @brief Effect of one Record call.
struct CoverageDelta {
    std::uint64_t bytes_added{0};
    std::uint64_t bytes_received{0};
    std::uint64_t total_size{0};
    bool coverage_total{false};
    // Exactly one Record per session observes this as true.
    bool became_total{false};
    SessionState state{SessionState::kPending};
};

/// @brief Result of ClaimFinalize; claimed is false when there is nothing to do.
struct FinalizeClaim {
    bool claimed{false};
    SessionSnapshot session;
};

/// @brief Per-file record of received ranges and lifecycle state.
///
/// Every session has its own mutex; the table mutex only guards lookup and
/// insertion of entries, so sessions never serialize against each other.
/// Mutations are written through to the SessionStore before they become
/// visible, and a failed write leaves the in-memory state unchanged.
class ProgressLedger {
public:
    explicit ProgressLedger(std::shared_ptr<metadata::SessionStore> store);

    /// Reloads every persisted session; call once before serving requests.
    core::Result<void> Load();

    core::Result<SessionSnapshot> Open(const std::string& filename, const std::string& owner,
                                       std::uint64_t total_size);
    /// kSessionClosed when the session is terminal or upload_id names a replaced session.
    core::Result<CoverageDelta> Record(const std::string& filename, const std::string& owner,
                                       const std::string& upload_id, const ByteRange& range);
    core::Result<SessionSnapshot> Status(const std::string& filename,
                                         const std::string& owner) const;
    std::vector<SessionSnapshot> List(const std::string& owner) const;
    std::vector<SessionSnapshot> ListAll() const;

    core::Result<void> MarkComplete(const std::string& filename, const std::string& owner);
    core::Result<void> MarkFailed(const std::string& filename, const std::string& owner);
    core::Result<void> MarkExpired(const std::string& filename, const std::string& owner);
    /// Expires the session only if it is still the given upload, non-terminal,
    /// unclaimed and idle since cutoff.
    core::Result<bool> ExpireIfIdle(const std::string& filename, const std::string& owner,
                                    const std::string& upload_id, std::int64_t cutoff_millis);

    core::Result<FinalizeClaim> ClaimFinalize(const std::string& filename,
                                              const std::string& owner);
    /// Drops a claim whose holder could not record a terminal state.
    void ReleaseFinalize(const std::string& filename, const std::string& owner);
    bool IsCovered(const std::string& filename, const std::string& owner,
                   const std::string& upload_id, const ByteRange& range) const;
    /// Returns the session as it was when removed.
    core::Result<SessionSnapshot> Remove(const std::string& filename, const std::string& owner);

private:
    using Key = std::pair<std::string, std::string>;  // (owner, filename)

    struct Entry {
        std::mutex mutex;
        bool exists{false};
        bool removed{false};
        bool finalizing{false};
        metadata::UploadSession session;
        RangeSet ranges;
    };

    using EntryPtr = std::shared_ptr<Entry>;

    /// Returns the entry locked; retries when a concurrent Remove unlinked it.
    std::pair<EntryPtr, std::unique_lock<std::mutex>> Acquire(const Key& key, bool create) const;
    /// Caller holds the entry lock.
    void Unlink(const Key& key, Entry& entry) const;
    core::Result<void> Persist(Entry& entry, metadata::UploadSession next, RangeSet next_ranges);
    core::Result<void> Transition(const std::string& filename, const std::string& owner,
                                  SessionState target);
    static SessionSnapshot Snapshot(const Entry& entry);

    std::shared_ptr<metadata::SessionStore> store_;
    mutable std::mutex table_mutex_;
    mutable std::map<Key, EntryPtr> entries_;
};

}  // namespace chunkvault::ledger
