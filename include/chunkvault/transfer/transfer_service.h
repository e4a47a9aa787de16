#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "chunkvault/core/result.h"
#include "chunkvault/ledger/progress_ledger.h"
#include "chunkvault/storage/artifact_store.h"
#include "chunkvault/storage/chunk_store.h"
#include "chunkvault/transfer/assembler.h"
#include "chunkvault/transfer/range_reader.h"

namespace chunkvault::transfer {

/// @brief Outcome of one accepted chunk.
struct UploadReceipt {
    ledger::SessionSnapshot session;
    std::uint64_t bytes_added{0};
    bool assembled{false};
    std::string etag;
};

struct RecoveryReport {
    std::size_t discarded_temps{0};
    std::size_t finalized{0};
    std::size_t released{0};
    std::size_t faults{0};
};

/// @brief Router-facing operations over the ledger, stores and assembler.
class TransferService {
public:
    TransferService(std::shared_ptr<ledger::ProgressLedger> ledger,
                    std::shared_ptr<storage::ChunkStore> chunks,
                    std::shared_ptr<storage::ArtifactStore> artifacts,
                    std::shared_ptr<Assembler> assembler, std::shared_ptr<RangeReader> reader);

    /// total_size is required when no session exists for the file yet.
    core::Result<UploadReceipt> UploadChunk(const std::string& owner, const std::string& filename,
                                            const std::string& body,
                                            std::optional<std::uint64_t> total_size);
    core::Result<RangeRead> Download(const std::string& owner, const std::string& filename,
                                     const std::optional<RangeRequest>& range) const;
    core::Result<ArtifactSlice> ResolveDownload(const std::string& owner,
                                                const std::string& filename,
                                                const std::optional<RangeRequest>& range) const;
    core::Result<ledger::SessionSnapshot> Status(const std::string& owner,
                                                 const std::string& filename) const;
    std::vector<ledger::SessionSnapshot> List(const std::string& owner) const;
    /// Deletes the artifact and cancels any upload; kNotFound when neither exists.
    core::Result<void> Remove(const std::string& owner, const std::string& filename);

    /// Startup pass over persisted sessions after an unclean stop.
    RecoveryReport Recover();

private:
    core::Error Reject(const std::string& owner, const std::string& filename,
                       const core::Error& error) const;
    void PurgeLateHoldings(const std::string& owner, const std::string& filename,
                           const std::string& upload_id);

    std::shared_ptr<ledger::ProgressLedger> ledger_;
    std::shared_ptr<storage::ChunkStore> chunks_;
    std::shared_ptr<storage::ArtifactStore> artifacts_;
    std::shared_ptr<Assembler> assembler_;
    std::shared_ptr<RangeReader> reader_;
};

}  // namespace chunkvault::transfer
