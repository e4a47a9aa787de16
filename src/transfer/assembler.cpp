#include "chunkvault/transfer/assembler.h"

#include <algorithm>

#include <Poco/DigestEngine.h>
#include <Poco/SHA2Engine.h>

#include "chunkvault/core/logger.h"
#include "chunkvault/observability/metrics.h"

namespace chunkvault::transfer {

Assembler::Assembler(std::shared_ptr<ledger::ProgressLedger> ledger,
                     std::shared_ptr<storage::ChunkStore> chunks,
                     std::shared_ptr<storage::ArtifactStore> artifacts, std::size_t block_size)
    : ledger_(std::move(ledger)),
      chunks_(std::move(chunks)),
      artifacts_(std::move(artifacts)),
      block_size_(block_size == 0 ? kDefaultBlockSize : block_size) {}

core::Result<FinalizeOutcome> Assembler::TryFinalize(const std::string& filename,
                                                     const std::string& owner) {
    auto claim = ledger_->ClaimFinalize(filename, owner);
    if (!claim.ok()) {
        return claim.error();
    }
    const auto& session = claim.value().session;
    if (!claim.value().claimed) {
        FinalizeOutcome outcome;
        outcome.size = session.total_size;
        return outcome;
    }

    auto merged = Merge(session);
    if (!merged.ok()) {
        return Fail(session, merged.error());
    }

    auto completed = ledger_->MarkComplete(filename, owner);
    if (!completed.ok()) {
        return Fail(session, completed.error());
    }

    auto purged = chunks_->Purge(filename, owner, session.upload_id);
    if (!purged.ok()) {
        // Recovery releases holdings of complete sessions on the next start.
        core::LogWarning("holdings of " + filename + " kept after assembly: " +
                         purged.error().message);
    }
    observability::RecordAssembly(true);
    core::LogTransferEvent("session_completed", owner, filename,
                           core::JsonFields{{"etag", merged.value().etag},
                                            {"size", std::to_string(merged.value().size)}});
    return merged.value();
}

core::Result<FinalizeOutcome> Assembler::Merge(const ledger::SessionSnapshot& session) {
    auto begun = artifacts_->BeginWrite();
    if (!begun.ok()) {
        return begun.error();
    }
    auto writer = std::move(begun.value());

    Poco::SHA2Engine256 sha256;
    std::uint64_t offset = 0;
    while (offset < session.total_size) {
        const std::uint64_t last =
            std::min<std::uint64_t>(offset + block_size_ - 1, session.total_size - 1);
        auto block = chunks_->ReadRange(session.filename, session.owner, session.upload_id,
                                        ByteRange{offset, last});
        if (!block.ok()) {
            return block.error();
        }
        const auto& bytes = block.value();
        auto appended = writer->Append(bytes.data(), bytes.size());
        if (!appended.ok()) {
            return appended.error();
        }
        sha256.update(bytes.data(), static_cast<unsigned int>(bytes.size()));
        offset = last + 1;
    }

    auto stored = artifacts_->Commit(*writer, session.owner, session.filename);
    if (!stored.ok()) {
        return stored.error();
    }

    FinalizeOutcome outcome;
    outcome.assembled = true;
    outcome.size = stored.value().size_bytes;
    outcome.etag = Poco::DigestEngine::digestToHex(sha256.digest());
    return outcome;
}

core::Error Assembler::Fail(const ledger::SessionSnapshot& session, const core::Error& cause) {
    const auto& filename = session.filename;
    const auto& owner = session.owner;
    core::LogError("assembly of " + filename + " failed: " + cause.message);

    auto deleted = artifacts_->Delete(owner, filename);
    if (!deleted.ok() && deleted.code() != core::ErrorCode::kNotFound) {
        core::LogError("partial artifact of " + filename + " not removed: " +
                       deleted.error().message);
    }
    auto failed = ledger_->MarkFailed(filename, owner);
    if (!failed.ok()) {
        core::LogError("could not mark " + filename + " failed: " + failed.error().message);
        ledger_->ReleaseFinalize(filename, owner);
    }
    auto purged = chunks_->Purge(filename, owner, session.upload_id);
    if (!purged.ok()) {
        core::LogWarning("holdings of " + filename + " kept after failure: " +
                         purged.error().message);
    }

    observability::RecordAssembly(false);
    core::LogTransferEvent("assembly_failed", owner, filename, core::ErrorCodeName(cause.code));
    return core::MakeError(core::ErrorCode::kAssemblyFailure,
                           "assembly of " + filename + " failed");
}

}  // namespace chunkvault::transfer
