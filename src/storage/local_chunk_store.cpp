#include "chunkvault/storage/local_chunk_store.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include "chunkvault/core/ids.h"
#include "chunkvault/core/logger.h"

namespace chunkvault::storage {

namespace {
constexpr const char* kHoldingSuffix = ".part";

core::Error IoFailure(const std::string& what, const std::string& path) {
    core::LogError(what + " " + path + ": " + std::strerror(errno));
    return core::MakeError(core::ErrorCode::kIoError, what);
}
}  // namespace

LocalChunkStore::LocalChunkStore(std::string root,
                                 std::shared_ptr<const ledger::ProgressLedger> ledger)
    : root_(std::move(root)), ledger_(std::move(ledger)) {
    std::filesystem::create_directories(root_);
}

std::string LocalChunkStore::HoldingPath(const std::string& filename, const std::string& owner,
                                         const std::string& upload_id) const {
    return (std::filesystem::path(root_) / core::OwnerDigest(owner) /
            (filename + "." + upload_id + kHoldingSuffix))
        .string();
}

core::Result<void> LocalChunkStore::WriteChunk(const std::string& filename,
                                               const std::string& owner,
                                               const std::string& upload_id,
                                               const ByteRange& range,
                                               const std::string& payload) {
    if (payload.size() != range.Length()) {
        return core::MakeError(core::ErrorCode::kInvalidArgument,
                               "payload length does not match range");
    }
    if (upload_id.empty()) {
        return core::MakeError(core::ErrorCode::kInvalidArgument, "upload id is required");
    }
    const auto path = HoldingPath(filename, owner, upload_id);
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    if (ec) {
        core::LogError("failed to create holding directory for " + path + ": " + ec.message());
        return core::MakeError(core::ErrorCode::kIoError, "failed to prepare holding area");
    }

    // No O_TRUNC: other chunks of the session already live in this file.
    const int fd = ::open(path.c_str(), O_CREAT | O_WRONLY, 0644);
    if (fd < 0) {
        return IoFailure("failed to open holding file", path);
    }
    const char* data = payload.data();
    std::size_t remaining = payload.size();
    auto offset = static_cast<off_t>(range.start);
    while (remaining > 0) {
        const ssize_t written = ::pwrite(fd, data, remaining, offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            auto error = IoFailure("failed to write chunk", path);
            ::close(fd);
            return error;
        }
        data += written;
        remaining -= static_cast<std::size_t>(written);
        offset += written;
    }
    if (::fsync(fd) != 0) {
        auto error = IoFailure("failed to sync chunk", path);
        ::close(fd);
        return error;
    }
    if (::close(fd) != 0) {
        return IoFailure("failed to close holding file", path);
    }
    return core::Ok();
}

core::Result<std::string> LocalChunkStore::ReadRange(const std::string& filename,
                                                     const std::string& owner,
                                                     const std::string& upload_id,
                                                     const ByteRange& range) const {
    if (range.start > range.end || !ledger_->IsCovered(filename, owner, upload_id, range)) {
        return core::MakeError(core::ErrorCode::kRangeUnavailable,
                               "range [" + std::to_string(range.start) + ", " +
                                   std::to_string(range.end) + "] of " + filename +
                                   " has not been received");
    }
    const auto path = HoldingPath(filename, owner, upload_id);
    const int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        if (errno == ENOENT) {
            return core::MakeError(core::ErrorCode::kRangeUnavailable,
                                   "holdings of " + filename + " are gone");
        }
        return IoFailure("failed to open holding file", path);
    }
    std::string bytes(static_cast<std::size_t>(range.Length()), '\0');
    std::size_t filled = 0;
    auto offset = static_cast<off_t>(range.start);
    while (filled < bytes.size()) {
        const ssize_t got = ::pread(fd, &bytes[filled], bytes.size() - filled, offset);
        if (got < 0) {
            if (errno == EINTR) {
                continue;
            }
            auto error = IoFailure("failed to read holding file", path);
            ::close(fd);
            return error;
        }
        if (got == 0) {
            ::close(fd);
            core::LogError("holding file " + path + " is shorter than its recorded ranges");
            return core::MakeError(core::ErrorCode::kIoError, "holding file truncated");
        }
        filled += static_cast<std::size_t>(got);
        offset += got;
    }
    ::close(fd);
    return bytes;
}

core::Result<void> LocalChunkStore::Purge(const std::string& filename, const std::string& owner,
                                          const std::string& upload_id) {
    const auto path = HoldingPath(filename, owner, upload_id);
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        core::LogError("failed to purge " + path + ": " + ec.message());
        return core::MakeError(core::ErrorCode::kIoError, "failed to purge holdings");
    }
    return core::Ok();
}

core::Result<std::size_t> LocalChunkStore::ReleaseOrphans(
    const std::set<std::string>& live_upload_ids) {
    std::size_t released = 0;
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(root_, ec), end;
    if (ec) {
        core::LogError("failed to scan holdings under " + root_ + ": " + ec.message());
        return core::MakeError(core::ErrorCode::kIoError, "failed to scan holdings");
    }
    std::vector<std::filesystem::path> orphans;
    for (; it != end; it.increment(ec)) {
        if (ec) {
            core::LogError("failed to scan holdings under " + root_ + ": " + ec.message());
            return core::MakeError(core::ErrorCode::kIoError, "failed to scan holdings");
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }
        // Upload ids never contain '.', so the id is the last dotted field before the suffix.
        const auto name = it->path().filename().string();
        const std::string suffix = kHoldingSuffix;
        if (name.size() <= suffix.size() ||
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
            continue;
        }
        const auto stem = name.substr(0, name.size() - suffix.size());
        const auto dot = stem.rfind('.');
        const auto upload_id = dot == std::string::npos ? std::string() : stem.substr(dot + 1);
        if (live_upload_ids.count(upload_id) == 0) {
            orphans.push_back(it->path());
        }
    }
    for (const auto& path : orphans) {
        std::filesystem::remove(path, ec);
        if (ec) {
            core::LogError("failed to release " + path.string() + ": " + ec.message());
            return core::MakeError(core::ErrorCode::kIoError, "failed to release holdings");
        }
        ++released;
    }
    return released;
}

}  // namespace chunkvault::storage
