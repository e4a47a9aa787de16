#pragma once

#include <cstdint>
#include <limits>
#include <memory>
#include <set>
#include <string>
#include <utility>

#include "chunkvault/storage/chunk_store.h"

namespace chunkvault::testing {

/// ChunkStore that delegates to a real store but fails reads reaching
/// fail_from and purges of the listed file names.
class FaultyChunkStore : public storage::ChunkStore {
public:
    explicit FaultyChunkStore(std::shared_ptr<storage::ChunkStore> inner,
                              std::uint64_t fail_from = std::numeric_limits<std::uint64_t>::max())
        : inner_(std::move(inner)), fail_from_(fail_from) {}

    core::Result<void> WriteChunk(const std::string& filename, const std::string& owner,
                                  const std::string& upload_id, const storage::ByteRange& range,
                                  const std::string& payload) override {
        return inner_->WriteChunk(filename, owner, upload_id, range, payload);
    }
    core::Result<std::string> ReadRange(const std::string& filename, const std::string& owner,
                                        const std::string& upload_id,
                                        const storage::ByteRange& range) const override {
        if (range.end >= fail_from_) {
            return core::Error{core::ErrorCode::kIoError, "injected read failure"};
        }
        return inner_->ReadRange(filename, owner, upload_id, range);
    }
    core::Result<void> Purge(const std::string& filename, const std::string& owner,
                             const std::string& upload_id) override {
        ++purges;
        if (failing_purges.count(filename) > 0) {
            return core::Error{core::ErrorCode::kIoError, "injected purge failure"};
        }
        return inner_->Purge(filename, owner, upload_id);
    }
    core::Result<std::size_t> ReleaseOrphans(
        const std::set<std::string>& live_upload_ids) override {
        return inner_->ReleaseOrphans(live_upload_ids);
    }

    int purges{0};
    std::set<std::string> failing_purges;

private:
    std::shared_ptr<storage::ChunkStore> inner_;
    std::uint64_t fail_from_;
};

}  // namespace chunkvault::testing
