#include "chunkvault/ledger/progress_ledger.h"

#include "chunkvault/core/ids.h"
#include "chunkvault/core/logger.h"
#include "chunkvault/core/time.h"

namespace chunkvault::ledger {

namespace {
using core::ErrorCode;
using metadata::IsTerminal;
using metadata::SessionStateName;

core::Error UnknownSession(const std::string& filename) {
    return core::MakeError(ErrorCode::kNotFound, "no upload session for " + filename);
}

bool IsReplaceable(SessionState state) {
    return state == SessionState::kFailed || state == SessionState::kExpired;
}
}  // namespace

ProgressLedger::ProgressLedger(std::shared_ptr<metadata::SessionStore> store)
    : store_(std::move(store)) {}

core::Result<void> ProgressLedger::Load() {
    auto loaded = store_->LoadSessions();
    if (!loaded.ok()) {
        return loaded.error();
    }
    std::lock_guard<std::mutex> table_lock(table_mutex_);
    entries_.clear();
    for (auto& session : loaded.value()) {
        auto entry = std::make_shared<Entry>();
        entry->ranges = RangeSet(session.received_ranges);
        session.received_ranges = entry->ranges.intervals();
        entry->session = std::move(session);
        entry->exists = true;
        entries_[Key{entry->session.owner, entry->session.filename}] = entry;
    }
    core::LogInfo("ledger loaded " + std::to_string(entries_.size()) + " sessions");
    return core::Ok();
}

std::pair<ProgressLedger::EntryPtr, std::unique_lock<std::mutex>> ProgressLedger::Acquire(
    const Key& key, bool create) const {
    for (;;) {
        EntryPtr entry;
        {
            std::lock_guard<std::mutex> table_lock(table_mutex_);
            auto it = entries_.find(key);
            if (it == entries_.end()) {
                if (!create) {
                    return {nullptr, std::unique_lock<std::mutex>()};
                }
                it = entries_.emplace(key, std::make_shared<Entry>()).first;
            }
            entry = it->second;
        }
        std::unique_lock<std::mutex> lock(entry->mutex);
        if (entry->removed) {
            continue;
        }
        if (!entry->exists && !create) {
            return {nullptr, std::unique_lock<std::mutex>()};
        }
        return {std::move(entry), std::move(lock)};
    }
}

void ProgressLedger::Unlink(const Key& key, Entry& entry) const {
    entry.removed = true;
    entry.exists = false;
    std::lock_guard<std::mutex> table_lock(table_mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end() && it->second.get() == &entry) {
        entries_.erase(it);
    }
}

core::Result<void> ProgressLedger::Persist(Entry& entry, metadata::UploadSession next,
                                           RangeSet next_ranges) {
    next.received_ranges = next_ranges.intervals();
    auto saved = store_->SaveSession(next);
    if (!saved.ok()) {
        return saved.error();
    }
    entry.session = std::move(next);
    entry.ranges = std::move(next_ranges);
    entry.exists = true;
    return core::Ok();
}

SessionSnapshot ProgressLedger::Snapshot(const Entry& entry) {
    SessionSnapshot snapshot;
    snapshot.owner = entry.session.owner;
    snapshot.filename = entry.session.filename;
    snapshot.upload_id = entry.session.upload_id;
    snapshot.total_size = entry.session.total_size;
    snapshot.bytes_received = entry.ranges.CoveredBytes();
    snapshot.next_expected_byte = entry.ranges.NextExpected(entry.session.total_size);
    snapshot.received_ranges = entry.ranges.intervals();
    snapshot.missing_ranges = entry.ranges.Missing(entry.session.total_size);
    snapshot.state = entry.session.state;
    snapshot.created_at = entry.session.created_at;
    snapshot.last_activity_at = entry.session.last_activity_at;
    return snapshot;
}

core::Result<SessionSnapshot> ProgressLedger::Open(const std::string& filename,
                                                   const std::string& owner,
                                                   std::uint64_t total_size) {
    if (total_size == 0) {
        return core::MakeError(ErrorCode::kInvalidArgument, "total_size must be positive");
    }
    const Key key{owner, filename};
    auto [entry, lock] = Acquire(key, true);

    if (entry->exists && !IsReplaceable(entry->session.state)) {
        if (entry->session.total_size != total_size) {
            return core::MakeError(ErrorCode::kSizeConflict,
                                   "declared size " + std::to_string(total_size) +
                                       " differs from " +
                                       std::to_string(entry->session.total_size));
        }
        return Snapshot(*entry);
    }

    const bool replacing = entry->exists;
    const auto now = core::NowEpochMillis();
    metadata::UploadSession fresh;
    fresh.owner = owner;
    fresh.filename = filename;
    fresh.upload_id = core::GenerateUploadId();
    fresh.total_size = total_size;
    fresh.state = SessionState::kPending;
    fresh.created_at = now;
    fresh.last_activity_at = now;

    auto persisted = Persist(*entry, fresh, RangeSet());
    if (!persisted.ok()) {
        if (!replacing) {
            Unlink(key, *entry);
        }
        return persisted.error();
    }
    entry->finalizing = false;
    core::LogTransferEvent(replacing ? "session_reopened" : "session_opened", owner, filename,
                           entry->session.upload_id);
    return Snapshot(*entry);
}

core::Result<CoverageDelta> ProgressLedger::Record(const std::string& filename,
                                                   const std::string& owner,
                                                   const std::string& upload_id,
                                                   const ByteRange& range) {
    auto [entry, lock] = Acquire(Key{owner, filename}, false);
    if (!entry) {
        return UnknownSession(filename);
    }
    const auto& current = entry->session;
    if (IsTerminal(current.state)) {
        return core::MakeError(ErrorCode::kSessionClosed,
                               filename + " is " + SessionStateName(current.state));
    }
    if (current.upload_id != upload_id) {
        return core::MakeError(ErrorCode::kSessionClosed,
                               "upload " + upload_id + " of " + filename + " was replaced");
    }
    if (range.start > range.end || range.end >= current.total_size) {
        return core::MakeError(ErrorCode::kOutOfBounds,
                               "range [" + std::to_string(range.start) + ", " +
                                   std::to_string(range.end) + "] outside file of " +
                                   std::to_string(current.total_size) + " bytes");
    }

    const bool was_total = entry->ranges.Covers(current.total_size);
    RangeSet next_ranges = entry->ranges;
    const auto added = next_ranges.Insert(range);

    metadata::UploadSession next = current;
    next.state = SessionState::kInProgress;
    next.last_activity_at = core::NowEpochMillis();

    auto persisted = Persist(*entry, std::move(next), std::move(next_ranges));
    if (!persisted.ok()) {
        return persisted.error();
    }

    CoverageDelta delta;
    delta.bytes_added = added;
    delta.bytes_received = entry->ranges.CoveredBytes();
    delta.total_size = entry->session.total_size;
    delta.coverage_total = entry->ranges.Covers(entry->session.total_size);
    delta.became_total = delta.coverage_total && !was_total;
    delta.state = entry->session.state;
    return delta;
}

core::Result<SessionSnapshot> ProgressLedger::Status(const std::string& filename,
                                                     const std::string& owner) const {
    auto [entry, lock] = Acquire(Key{owner, filename}, false);
    if (!entry) {
        return UnknownSession(filename);
    }
    return Snapshot(*entry);
}

std::vector<SessionSnapshot> ProgressLedger::List(const std::string& owner) const {
    std::vector<EntryPtr> candidates;
    {
        std::lock_guard<std::mutex> table_lock(table_mutex_);
        for (auto it = entries_.lower_bound(Key{owner, std::string()});
             it != entries_.end() && it->first.first == owner; ++it) {
            candidates.push_back(it->second);
        }
    }
    std::vector<SessionSnapshot> snapshots;
    for (const auto& entry : candidates) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->exists && !entry->removed) {
            snapshots.push_back(Snapshot(*entry));
        }
    }
    return snapshots;
}

std::vector<SessionSnapshot> ProgressLedger::ListAll() const {
    std::vector<EntryPtr> candidates;
    {
        std::lock_guard<std::mutex> table_lock(table_mutex_);
        candidates.reserve(entries_.size());
        for (const auto& [key, entry] : entries_) {
            candidates.push_back(entry);
        }
    }
    std::vector<SessionSnapshot> snapshots;
    for (const auto& entry : candidates) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->exists && !entry->removed) {
            snapshots.push_back(Snapshot(*entry));
        }
    }
    return snapshots;
}

core::Result<void> ProgressLedger::Transition(const std::string& filename,
                                              const std::string& owner, SessionState target) {
    auto [entry, lock] = Acquire(Key{owner, filename}, false);
    if (!entry) {
        return UnknownSession(filename);
    }
    const auto current = entry->session.state;
    if (current == target) {
        entry->finalizing = false;
        return core::Ok();
    }
    if (IsTerminal(current)) {
        const std::string message = std::string("cannot move ") + filename + " from " +
                                    SessionStateName(current) + " to " +
                                    SessionStateName(target);
        core::LogError(message);
        return core::MakeError(ErrorCode::kInvalidTransition, message);
    }
    if (target == SessionState::kComplete && !entry->ranges.Covers(entry->session.total_size)) {
        const std::string message = "cannot complete " + filename + " without total coverage";
        core::LogError(message);
        return core::MakeError(ErrorCode::kInvalidTransition, message);
    }
    if (target == SessionState::kExpired && entry->finalizing) {
        return core::MakeError(ErrorCode::kSessionBusy, filename + " is being assembled");
    }

    metadata::UploadSession next = entry->session;
    next.state = target;
    next.last_activity_at = core::NowEpochMillis();
    auto persisted = Persist(*entry, std::move(next), entry->ranges);
    if (!persisted.ok()) {
        return persisted.error();
    }
    entry->finalizing = false;
    return core::Ok();
}

core::Result<void> ProgressLedger::MarkComplete(const std::string& filename,
                                                const std::string& owner) {
    return Transition(filename, owner, SessionState::kComplete);
}

core::Result<void> ProgressLedger::MarkFailed(const std::string& filename,
                                              const std::string& owner) {
    return Transition(filename, owner, SessionState::kFailed);
}

core::Result<void> ProgressLedger::MarkExpired(const std::string& filename,
                                               const std::string& owner) {
    return Transition(filename, owner, SessionState::kExpired);
}

core::Result<bool> ProgressLedger::ExpireIfIdle(const std::string& filename,
                                                const std::string& owner,
                                                const std::string& upload_id,
                                                std::int64_t cutoff_millis) {
    auto [entry, lock] = Acquire(Key{owner, filename}, false);
    if (!entry) {
        return false;
    }
    if (entry->session.upload_id != upload_id || IsTerminal(entry->session.state) ||
        entry->finalizing ||
        entry->session.last_activity_at >= cutoff_millis) {
        return false;
    }
    metadata::UploadSession next = entry->session;
    next.state = SessionState::kExpired;
    auto persisted = Persist(*entry, std::move(next), entry->ranges);
    if (!persisted.ok()) {
        return persisted.error();
    }
    return true;
}

core::Result<FinalizeClaim> ProgressLedger::ClaimFinalize(const std::string& filename,
                                                          const std::string& owner) {
    auto [entry, lock] = Acquire(Key{owner, filename}, false);
    if (!entry) {
        return UnknownSession(filename);
    }
    FinalizeClaim claim;
    claim.session = Snapshot(*entry);
    const auto state = entry->session.state;
    if (state == SessionState::kComplete || entry->finalizing) {
        return claim;
    }
    if (IsTerminal(state)) {
        return core::MakeError(ErrorCode::kSessionClosed,
                               filename + " is " + SessionStateName(state));
    }
    if (!entry->ranges.Covers(entry->session.total_size)) {
        return core::MakeError(ErrorCode::kInvalidTransition,
                               "cannot assemble " + filename + " without total coverage");
    }
    entry->finalizing = true;
    claim.claimed = true;
    return claim;
}

void ProgressLedger::ReleaseFinalize(const std::string& filename, const std::string& owner) {
    auto [entry, lock] = Acquire(Key{owner, filename}, false);
    if (entry) {
        entry->finalizing = false;
    }
}

bool ProgressLedger::IsCovered(const std::string& filename, const std::string& owner,
                               const std::string& upload_id, const ByteRange& range) const {
    auto [entry, lock] = Acquire(Key{owner, filename}, false);
    if (!entry || entry->session.upload_id != upload_id ||
        IsReplaceable(entry->session.state)) {
        return false;
    }
    return entry->ranges.Contains(range);
}

core::Result<SessionSnapshot> ProgressLedger::Remove(const std::string& filename,
                                                     const std::string& owner) {
    const Key key{owner, filename};
    auto [entry, lock] = Acquire(key, false);
    if (!entry) {
        return UnknownSession(filename);
    }
    if (entry->finalizing) {
        return core::MakeError(ErrorCode::kSessionBusy, filename + " is being assembled");
    }
    auto deleted = store_->DeleteSession(owner, filename);
    if (!deleted.ok()) {
        return deleted.error();
    }
    auto removed = Snapshot(*entry);
    Unlink(key, *entry);
    return removed;
}

}  // namespace chunkvault::ledger
