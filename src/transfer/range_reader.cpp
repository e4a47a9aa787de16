#include "chunkvault/transfer/range_reader.h"

#include <cctype>
#include <limits>

#include "chunkvault/core/logger.h"

namespace chunkvault::transfer {

namespace {
bool ParseOffset(const std::string& text, std::uint64_t* out) {
    if (text.empty()) {
        return false;
    }
    std::uint64_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        const auto digit = static_cast<std::uint64_t>(c - '0');
        if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }
    *out = value;
    return true;
}
}  // namespace

RangeReader::RangeReader(std::shared_ptr<const ledger::ProgressLedger> ledger,
                         std::shared_ptr<const storage::ArtifactStore> artifacts)
    : ledger_(std::move(ledger)), artifacts_(std::move(artifacts)) {}

core::Result<ArtifactSlice> RangeReader::Resolve(
    const std::string& filename, const std::string& owner,
    const std::optional<RangeRequest>& request) const {
    auto status = ledger_->Status(filename, owner);
    if (!status.ok()) {
        return status.error();
    }
    if (status.value().state != ledger::SessionState::kComplete) {
        return core::MakeError(core::ErrorCode::kFileNotReady,
                               filename + " is " +
                                   metadata::SessionStateName(status.value().state));
    }
    auto stored = artifacts_->Stat(owner, filename);
    if (!stored.ok()) {
        core::LogError("complete session " + filename + " has no artifact");
        return core::MakeError(core::ErrorCode::kIoError, "artifact unavailable");
    }

    ArtifactSlice slice;
    slice.path = stored.value().path;
    slice.total_size = stored.value().size_bytes;
    if (!request) {
        slice.range = ByteRange{0, slice.total_size - 1};
        return slice;
    }

    const auto last = slice.total_size - 1;
    const auto start = request->start;
    const auto end = request->end.value_or(last);
    if (start > end || end > last || start > last) {
        return core::MakeError(core::ErrorCode::kRangeNotSatisfiable,
                               "range not satisfiable for file of size " +
                                   std::to_string(slice.total_size));
    }
    slice.range = ByteRange{start, end};
    slice.partial = true;
    return slice;
}

core::Result<RangeRead> RangeReader::Read(const std::string& filename, const std::string& owner,
                                          const std::optional<RangeRequest>& request) const {
    auto slice = Resolve(filename, owner, request);
    if (!slice.ok()) {
        return slice.error();
    }
    auto bytes = artifacts_->ReadRange(owner, filename, slice.value().range);
    if (!bytes.ok()) {
        return bytes.error();
    }
    RangeRead read;
    read.data = std::move(bytes.value());
    read.slice = slice.value();
    return read;
}

std::optional<RangeRequest> RangeReader::ParseRangeHeader(const std::string& value) {
    const std::string prefix = "bytes=";
    if (value.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    const auto bounds = value.substr(prefix.size());
    const auto dash = bounds.find('-');
    if (dash == std::string::npos || bounds.find('-', dash + 1) != std::string::npos) {
        return std::nullopt;
    }
    RangeRequest request;
    if (!ParseOffset(bounds.substr(0, dash), &request.start)) {
        return std::nullopt;
    }
    const auto end_text = bounds.substr(dash + 1);
    if (!end_text.empty()) {
        std::uint64_t end = 0;
        if (!ParseOffset(end_text, &end)) {
            return std::nullopt;
        }
        request.end = end;
    }
    return request;
}

std::string RangeReader::ContentRange(const ArtifactSlice& slice) {
    return "bytes " + std::to_string(slice.range.start) + "-" + std::to_string(slice.range.end) +
           "/" + std::to_string(slice.total_size);
}

}  // namespace chunkvault::transfer
