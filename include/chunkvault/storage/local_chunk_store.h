#pragma once

#include <memory>
#include <string>

#include "chunkvault/ledger/progress_ledger.h"
#include "chunkvault/storage/chunk_store.h"

namespace chunkvault::storage {

/// @brief ChunkStore keeping one sparse holding file per session on local disk.
///
/// Chunks are written in place at their file offset, so a session's holding
/// file mirrors the final artifact byte for byte once coverage is total.
class LocalChunkStore : public ChunkStore {
public:
    LocalChunkStore(std::string root, std::shared_ptr<const ledger::ProgressLedger> ledger);

    core::Result<void> WriteChunk(const std::string& filename, const std::string& owner,
                                  const std::string& upload_id, const ByteRange& range,
                                  const std::string& payload) override;
    core::Result<std::string> ReadRange(const std::string& filename, const std::string& owner,
                                        const std::string& upload_id,
                                        const ByteRange& range) const override;
    core::Result<void> Purge(const std::string& filename, const std::string& owner,
                             const std::string& upload_id) override;
    core::Result<std::size_t> ReleaseOrphans(
        const std::set<std::string>& live_upload_ids) override;

    /// <root>/<owner digest>/<filename>.<upload id>.part
    std::string HoldingPath(const std::string& filename, const std::string& owner,
                            const std::string& upload_id) const;
    const std::string& root() const { return root_; }

private:
    std::string root_;
    std::shared_ptr<const ledger::ProgressLedger> ledger_;
};

}  // namespace chunkvault::storage
