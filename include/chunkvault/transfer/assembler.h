#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "chunkvault/core/result.h"
#include "chunkvault/ledger/progress_ledger.h"
#include "chunkvault/storage/artifact_store.h"
#include "chunkvault/storage/chunk_store.h"

namespace chunkvault::transfer {

/// @brief assembled is false when another caller finalized or is finalizing the session.
struct FinalizeOutcome {
    bool assembled{false};
    std::uint64_t size{0};
    std::string etag;
};

/// @brief Turns a fully covered session into a published artifact exactly once.
class Assembler {
public:
    static constexpr std::size_t kDefaultBlockSize = 1024 * 1024;

    Assembler(std::shared_ptr<ledger::ProgressLedger> ledger,
              std::shared_ptr<storage::ChunkStore> chunks,
              std::shared_ptr<storage::ArtifactStore> artifacts,
              std::size_t block_size = kDefaultBlockSize);

    /// Fails with kAssemblyFailure after marking the session FAILED when any
    /// block cannot be read or written; no partial artifact remains.
    core::Result<FinalizeOutcome> TryFinalize(const std::string& filename,
                                              const std::string& owner);

private:
    core::Result<FinalizeOutcome> Merge(const ledger::SessionSnapshot& session);
    core::Error Fail(const ledger::SessionSnapshot& session, const core::Error& cause);

    std::shared_ptr<ledger::ProgressLedger> ledger_;
    std::shared_ptr<storage::ChunkStore> chunks_;
    std::shared_ptr<storage::ArtifactStore> artifacts_;
    std::size_t block_size_;
};

}  // namespace chunkvault::transfer
