#include "chunkvault/transfer/transfer_service.h"

#include <set>

#include "chunkvault/core/logger.h"
#include "chunkvault/observability/metrics.h"

namespace chunkvault::transfer {

namespace {
using core::ErrorCode;
using ledger::SessionState;
}  // namespace

TransferService::TransferService(std::shared_ptr<ledger::ProgressLedger> ledger,
                                 std::shared_ptr<storage::ChunkStore> chunks,
                                 std::shared_ptr<storage::ArtifactStore> artifacts,
                                 std::shared_ptr<Assembler> assembler,
                                 std::shared_ptr<RangeReader> reader)
    : ledger_(std::move(ledger)),
      chunks_(std::move(chunks)),
      artifacts_(std::move(artifacts)),
      assembler_(std::move(assembler)),
      reader_(std::move(reader)) {}

core::Error TransferService::Reject(const std::string& owner, const std::string& filename,
                                    const core::Error& error) const {
    observability::RecordChunkRejected();
    core::LogTransferEvent("chunk_rejected", owner, filename, core::ErrorCodeName(error.code));
    return error;
}

void TransferService::PurgeLateHoldings(const std::string& owner, const std::string& filename,
                                        const std::string& upload_id) {
    // Only the closed upload's own file; a session that replaced it holds its bytes elsewhere.
    auto purged = chunks_->Purge(filename, owner, upload_id);
    if (!purged.ok()) {
        core::LogWarning("late holdings of " + filename + " kept: " + purged.error().message);
    }
}

core::Result<UploadReceipt> TransferService::UploadChunk(const std::string& owner,
                                                         const std::string& filename,
                                                         const std::string& body,
                                                         std::optional<std::uint64_t> total_size) {
    if (!storage::ArtifactStore::IsSafeName(filename)) {
        return Reject(owner, filename,
                      core::MakeError(ErrorCode::kInvalidArgument, "invalid file name"));
    }
    auto decoded = DecodeChunk(body);
    if (!decoded.ok()) {
        return Reject(owner, filename, decoded.error());
    }
    const auto& chunk = decoded.value();
    auto verified = VerifyChunk(chunk.header, chunk.payload);
    if (!verified.ok()) {
        return Reject(owner, filename, verified.error());
    }

    core::Result<ledger::SessionSnapshot> session =
        total_size ? ledger_->Open(filename, owner, *total_size) : ledger_->Status(filename, owner);
    if (!session.ok()) {
        if (!total_size && session.code() == ErrorCode::kNotFound) {
            return Reject(owner, filename,
                          core::MakeError(ErrorCode::kInvalidArgument,
                                          "total_size is required to start an upload"));
        }
        return Reject(owner, filename, session.error());
    }

    const auto range = chunk.header.range();
    const auto& opened = session.value();
    if (metadata::IsTerminal(opened.state)) {
        return Reject(owner, filename,
                      core::MakeError(ErrorCode::kSessionClosed,
                                      filename + " is " + metadata::SessionStateName(opened.state)));
    }
    if (range.end >= opened.total_size) {
        return Reject(owner, filename,
                      core::MakeError(ErrorCode::kOutOfBounds,
                                      "chunk ends at " + std::to_string(range.end) +
                                          " beyond file of " +
                                          std::to_string(opened.total_size) + " bytes"));
    }

    auto written = chunks_->WriteChunk(filename, owner, opened.upload_id, range, chunk.payload);
    if (!written.ok()) {
        return written.error();
    }

    auto recorded = ledger_->Record(filename, owner, opened.upload_id, range);
    if (!recorded.ok()) {
        if (recorded.code() == ErrorCode::kSessionClosed ||
            recorded.code() == ErrorCode::kNotFound) {
            PurgeLateHoldings(owner, filename, opened.upload_id);
        }
        return Reject(owner, filename, recorded.error());
    }
    observability::RecordChunkAccepted(range.Length());

    UploadReceipt receipt;
    receipt.bytes_added = recorded.value().bytes_added;
    if (recorded.value().became_total) {
        auto finalized = assembler_->TryFinalize(filename, owner);
        if (!finalized.ok()) {
            return finalized.error();
        }
        receipt.assembled = finalized.value().assembled;
        receipt.etag = finalized.value().etag;
    }

    auto status = ledger_->Status(filename, owner);
    if (!status.ok()) {
        return status.error();
    }
    receipt.session = std::move(status.value());
    return receipt;
}

core::Result<RangeRead> TransferService::Download(const std::string& owner,
                                                  const std::string& filename,
                                                  const std::optional<RangeRequest>& range) const {
    return reader_->Read(filename, owner, range);
}

core::Result<ArtifactSlice> TransferService::ResolveDownload(
    const std::string& owner, const std::string& filename,
    const std::optional<RangeRequest>& range) const {
    return reader_->Resolve(filename, owner, range);
}

core::Result<ledger::SessionSnapshot> TransferService::Status(const std::string& owner,
                                                              const std::string& filename) const {
    return ledger_->Status(filename, owner);
}

std::vector<ledger::SessionSnapshot> TransferService::List(const std::string& owner) const {
    return ledger_->List(owner);
}

core::Result<void> TransferService::Remove(const std::string& owner, const std::string& filename) {
    if (!storage::ArtifactStore::IsSafeName(filename)) {
        return core::MakeError(ErrorCode::kInvalidArgument, "invalid file name");
    }
    auto removed = ledger_->Remove(filename, owner);
    if (!removed.ok() && removed.code() != ErrorCode::kNotFound) {
        return removed.error();
    }
    auto deleted = artifacts_->Delete(owner, filename);
    if (!deleted.ok() && deleted.code() != ErrorCode::kNotFound) {
        return deleted.error();
    }
    if (removed.ok()) {
        auto purged = chunks_->Purge(filename, owner, removed.value().upload_id);
        if (!purged.ok()) {
            return purged.error();
        }
    }
    if (!removed.ok() && !deleted.ok()) {
        return core::MakeError(ErrorCode::kNotFound, filename + " not found");
    }
    core::LogTransferEvent("session_removed", owner, filename, "");
    return core::Ok();
}

RecoveryReport TransferService::Recover() {
    RecoveryReport report;
    report.discarded_temps = artifacts_->DiscardStaleTemps();

    for (const auto& session : ledger_->ListAll()) {
        if (session.state != SessionState::kPending && session.state != SessionState::kInProgress) {
            continue;
        }
        if (session.bytes_received != session.total_size) {
            continue;
        }
        // Coverage was total but the artifact was never published.
        auto finalized = assembler_->TryFinalize(session.filename, session.owner);
        if (finalized.ok() && finalized.value().assembled) {
            ++report.finalized;
        } else if (!finalized.ok()) {
            ++report.faults;
        }
    }

    // Holdings survive only for uploads still accepting chunks.
    std::set<std::string> live;
    for (const auto& session : ledger_->ListAll()) {
        if (session.state == SessionState::kPending || session.state == SessionState::kInProgress) {
            live.insert(session.upload_id);
        }
    }
    auto released = chunks_->ReleaseOrphans(live);
    if (released.ok()) {
        report.released = released.value();
    } else {
        ++report.faults;
        core::LogWarning("recovery could not release holdings: " + released.error().message);
    }
    core::LogInfo("recovery discarded " + std::to_string(report.discarded_temps) +
                  " temp files, finalized " + std::to_string(report.finalized) +
                  " sessions, released " + std::to_string(report.released) + " holdings");
    return report;
}

}  // namespace chunkvault::transfer
