#pragma once

#include <cstddef>
#include <set>
#include <string>

#include "chunkvault/core/result.h"
#include "chunkvault/transfer/chunk_codec.h"

namespace chunkvault::storage {

using transfer::ByteRange;

/// @brief Durable holding area for chunk bytes of sessions that are not yet assembled.
///
/// Holdings belong to one upload id, so a reopened file never shares bytes
/// with the session it replaced.
class ChunkStore {
public:
    virtual ~ChunkStore() = default;

    /// Persists payload at range; returns only after the bytes are durable.
    virtual core::Result<void> WriteChunk(const std::string& filename, const std::string& owner,
                                          const std::string& upload_id, const ByteRange& range,
                                          const std::string& payload) = 0;
    /// kRangeUnavailable unless the range is recorded as received for this upload and present.
    virtual core::Result<std::string> ReadRange(const std::string& filename,
                                                const std::string& owner,
                                                const std::string& upload_id,
                                                const ByteRange& range) const = 0;
    /// Releases every held byte of the upload; succeeds when nothing is held.
    virtual core::Result<void> Purge(const std::string& filename, const std::string& owner,
                                     const std::string& upload_id) = 0;
    /// Releases holdings of every upload not listed; returns how many were released.
    virtual core::Result<std::size_t> ReleaseOrphans(
        const std::set<std::string>& live_upload_ids) = 0;
};

}  // namespace chunkvault::storage
