#include "chunkvault/ledger/range_set.h"

#include <algorithm>

namespace chunkvault::ledger {

RangeSet::RangeSet(const std::vector<ByteRange>& ranges) {
    for (const auto& range : ranges) {
        Insert(range);
    }
}

std::uint64_t RangeSet::Insert(const ByteRange& range) {
    // First interval whose end reaches range.start - 1 (adjacency counts as overlap).
    auto first = std::lower_bound(intervals_.begin(), intervals_.end(), range.start,
                                  [](const ByteRange& interval, std::uint64_t start) {
                                      return interval.end != UINT64_MAX &&
                                             interval.end + 1 < start;
                                  });

    ByteRange merged = range;
    std::uint64_t already_covered = 0;
    auto last = first;
    while (last != intervals_.end() &&
           (range.end == UINT64_MAX || last->start <= range.end + 1)) {
        const auto overlap_start = std::max(last->start, range.start);
        const auto overlap_end = std::min(last->end, range.end);
        if (overlap_start <= overlap_end) {
            already_covered += overlap_end - overlap_start + 1;
        }
        merged.start = std::min(merged.start, last->start);
        merged.end = std::max(merged.end, last->end);
        ++last;
    }

    const auto pos = intervals_.erase(first, last);
    intervals_.insert(pos, merged);
    return range.Length() - already_covered;
}

bool RangeSet::Contains(const ByteRange& range) const {
    auto it = std::upper_bound(intervals_.begin(), intervals_.end(), range.start,
                               [](std::uint64_t start, const ByteRange& interval) {
                                   return start < interval.start;
                               });
    if (it == intervals_.begin()) {
        return false;
    }
    --it;
    return it->Contains(range);
}

bool RangeSet::Covers(std::uint64_t total_size) const {
    if (total_size == 0) {
        return intervals_.empty();
    }
    return intervals_.size() == 1 && intervals_.front().start == 0 &&
           intervals_.front().end == total_size - 1;
}

std::uint64_t RangeSet::CoveredBytes() const {
    std::uint64_t total = 0;
    for (const auto& interval : intervals_) {
        total += interval.Length();
    }
    return total;
}

std::vector<ByteRange> RangeSet::Missing(std::uint64_t total_size) const {
    std::vector<ByteRange> gaps;
    if (total_size == 0) {
        return gaps;
    }
    std::uint64_t cursor = 0;
    for (const auto& interval : intervals_) {
        if (interval.start >= total_size) {
            break;
        }
        if (interval.start > cursor) {
            gaps.push_back(ByteRange{cursor, interval.start - 1});
        }
        if (interval.end >= total_size - 1) {
            return gaps;
        }
        cursor = interval.end + 1;
    }
    gaps.push_back(ByteRange{cursor, total_size - 1});
    return gaps;
}

std::uint64_t RangeSet::NextExpected(std::uint64_t total_size) const {
    if (intervals_.empty() || intervals_.front().start > 0) {
        return 0;
    }
    return std::min(intervals_.front().end + 1, total_size);
}

}  // namespace chunkvault::ledger
