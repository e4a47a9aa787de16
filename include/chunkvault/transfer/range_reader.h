#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "chunkvault/core/result.h"
#include "chunkvault/ledger/progress_ledger.h"
#include "chunkvault/storage/artifact_store.h"

namespace chunkvault::transfer {

/// @brief Requested byte range; an absent end means "through the last byte".
struct RangeRequest {
    std::uint64_t start{0};
    std::optional<std::uint64_t> end;
};

/// @brief Validated slice of a complete artifact.
struct ArtifactSlice {
    std::string path;
    ByteRange range;
    std::uint64_t total_size{0};
    // True when a range was requested (206) rather than the whole file.
    bool partial{false};
};

struct RangeRead {
    std::string data;
    ArtifactSlice slice;
};

/// @brief Serves bytes of COMPLETE artifacts under optional range requests.
class RangeReader {
public:
    RangeReader(std::shared_ptr<const ledger::ProgressLedger> ledger,
                std::shared_ptr<const storage::ArtifactStore> artifacts);

    core::Result<ArtifactSlice> Resolve(const std::string& filename, const std::string& owner,
                                        const std::optional<RangeRequest>& request) const;
    core::Result<RangeRead> Read(const std::string& filename, const std::string& owner,
                                 const std::optional<RangeRequest>& request) const;

    /// Parses a "bytes=a-b" or "bytes=a-" header value; nullopt when malformed.
    static std::optional<RangeRequest> ParseRangeHeader(const std::string& value);
    static std::string ContentRange(const ArtifactSlice& slice);

private:
    std::shared_ptr<const ledger::ProgressLedger> ledger_;
    std::shared_ptr<const storage::ArtifactStore> artifacts_;
};

}  // namespace chunkvault::transfer
