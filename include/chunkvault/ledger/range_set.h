#pragma once

#include <cstdint>
#include <vector>

#include "chunkvault/transfer/chunk_codec.h"

namespace chunkvault::ledger {

using transfer::ByteRange;

/// @brief Sorted set of disjoint inclusive intervals; touching intervals are merged.
class RangeSet {
public:
    RangeSet() = default;
    /// Builds a set from arbitrary, possibly overlapping ranges.
    explicit RangeSet(const std::vector<ByteRange>& ranges);

    /// Inserts range, merging with every overlapping or adjacent interval.
    /// Returns the number of bytes that were not covered before.
    std::uint64_t Insert(const ByteRange& range);

    bool Contains(const ByteRange& range) const;
    /// True when the set is exactly [0, total_size - 1].
    bool Covers(std::uint64_t total_size) const;
    std::uint64_t CoveredBytes() const;
    /// Intervals of [0, total_size - 1] that are not in the set.
    std::vector<ByteRange> Missing(std::uint64_t total_size) const;
    /// First offset not covered when scanning from 0; total_size if none.
    std::uint64_t NextExpected(std::uint64_t total_size) const;

    const std::vector<ByteRange>& intervals() const { return intervals_; }
    bool empty() const { return intervals_.empty(); }

private:
    std::vector<ByteRange> intervals_;
};

}  // namespace chunkvault::ledger
