#include "chunkvault/storage/artifact_store.h"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

#include <Poco/UUIDGenerator.h>

#include <fcntl.h>
#include <unistd.h>

#include "chunkvault/core/ids.h"
#include "chunkvault/core/logger.h"

namespace chunkvault::storage {

namespace {
core::Error IoFailure(const std::string& what, const std::string& path) {
    core::LogError(what + " " + path + ": " + std::strerror(errno));
    return core::MakeError(core::ErrorCode::kIoError, what);
}

// Makes a completed rename durable.
void SyncDirectory(const std::filesystem::path& dir) {
    const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return;
    }
    ::fsync(fd);
    ::close(fd);
}
}  // namespace

ArtifactWriter::ArtifactWriter(OpenToken, int fd, std::string temp_path)
    : fd_(fd), temp_path_(std::move(temp_path)) {}

ArtifactWriter::~ArtifactWriter() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    if (!committed_) {
        std::error_code ec;
        std::filesystem::remove(temp_path_, ec);
    }
}

core::Result<void> ArtifactWriter::Append(const char* data, std::size_t size) {
    if (fd_ < 0) {
        return core::MakeError(core::ErrorCode::kInternal, "artifact writer is closed");
    }
    while (size > 0) {
        const ssize_t written = ::write(fd_, data, size);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return IoFailure("failed to write temp file", temp_path_);
        }
        data += written;
        size -= static_cast<std::size_t>(written);
        written_ += static_cast<std::uint64_t>(written);
    }
    return core::Ok();
}

ArtifactStore::ArtifactStore(std::string base_path, std::string temp_path)
    : base_path_((std::filesystem::path(base_path) / "artifacts").string()),
      temp_path_((std::filesystem::path(temp_path) / "assembly").string()) {
    std::filesystem::create_directories(base_path_);
    std::filesystem::create_directories(temp_path_);
}

std::string ArtifactStore::ArtifactPath(const std::string& owner,
                                        const std::string& filename) const {
    return (std::filesystem::path(base_path_) / core::OwnerDigest(owner) / filename).string();
}

core::Result<std::unique_ptr<ArtifactWriter>> ArtifactStore::BeginWrite() {
    const auto temp_name = Poco::UUIDGenerator().createRandom().toString();
    const auto temp_file = (std::filesystem::path(temp_path_) / temp_name).string();
    const int fd = ::open(temp_file.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
    if (fd < 0) {
        return IoFailure("failed to open temp file", temp_file);
    }
    return std::make_unique<ArtifactWriter>(ArtifactWriter::OpenToken(), fd, temp_file);
}

core::Result<StoredArtifact> ArtifactStore::Commit(ArtifactWriter& writer,
                                                   const std::string& owner,
                                                   const std::string& filename) {
    if (!IsSafeName(filename)) {
        return core::MakeError(core::ErrorCode::kInvalidArgument, "invalid file name");
    }
    if (writer.fd_ < 0) {
        return core::MakeError(core::ErrorCode::kInternal, "artifact writer is closed");
    }
    if (::fsync(writer.fd_) != 0) {
        return IoFailure("failed to sync temp file", writer.temp_path_);
    }
    const int fd = writer.fd_;
    writer.fd_ = -1;
    if (::close(fd) != 0) {
        return IoFailure("failed to close temp file", writer.temp_path_);
    }

    const std::filesystem::path final_path = ArtifactPath(owner, filename);
    std::error_code ec;
    std::filesystem::create_directories(final_path.parent_path(), ec);
    if (!ec) {
        std::filesystem::rename(writer.temp_path_, final_path, ec);
    }
    if (ec) {
        core::LogError("failed to publish " + final_path.string() + ": " + ec.message());
        return core::MakeError(core::ErrorCode::kIoError, "failed to publish artifact");
    }
    writer.committed_ = true;
    SyncDirectory(final_path.parent_path());

    StoredArtifact stored;
    stored.path = final_path.string();
    stored.size_bytes = writer.written_;
    return stored;
}

core::Result<StoredArtifact> ArtifactStore::Stat(const std::string& owner,
                                                 const std::string& filename) const {
    if (!IsSafeName(filename)) {
        return core::MakeError(core::ErrorCode::kInvalidArgument, "invalid file name");
    }
    const auto path = ArtifactPath(owner, filename);
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return core::MakeError(core::ErrorCode::kNotFound, "artifact not found");
    }
    StoredArtifact stored;
    stored.path = path;
    stored.size_bytes = static_cast<std::uint64_t>(size);
    return stored;
}

core::Result<std::string> ArtifactStore::ReadRange(const std::string& owner,
                                                   const std::string& filename,
                                                   const transfer::ByteRange& range) const {
    auto stat = Stat(owner, filename);
    if (!stat.ok()) {
        return stat.error();
    }
    const auto& path = stat.value().path;
    const int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        return IoFailure("failed to open artifact", path);
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
            auto error = IoFailure("failed to read artifact", path);
            ::close(fd);
            return error;
        }
        if (got == 0) {
            ::close(fd);
            core::LogError("artifact " + path + " is shorter than requested range");
            return core::MakeError(core::ErrorCode::kIoError, "artifact truncated");
        }
        filled += static_cast<std::size_t>(got);
        offset += got;
    }
    ::close(fd);
    return bytes;
}

core::Result<void> ArtifactStore::Delete(const std::string& owner, const std::string& filename) {
    if (!IsSafeName(filename)) {
        return core::MakeError(core::ErrorCode::kInvalidArgument, "invalid file name");
    }
    const auto path = ArtifactPath(owner, filename);
    std::error_code ec;
    const bool removed = std::filesystem::remove(path, ec);
    if (ec) {
        core::LogError("failed to delete " + path + ": " + ec.message());
        return core::MakeError(core::ErrorCode::kIoError, "failed to delete artifact");
    }
    if (!removed) {
        return core::MakeError(core::ErrorCode::kNotFound, "artifact not found");
    }
    return core::Ok();
}

std::size_t ArtifactStore::DiscardStaleTemps() {
    std::size_t discarded = 0;
    std::error_code ec;
    for (const auto& item : std::filesystem::directory_iterator(temp_path_, ec)) {
        std::error_code remove_ec;
        if (item.is_regular_file(remove_ec) && std::filesystem::remove(item.path(), remove_ec)) {
            ++discarded;
        }
        if (remove_ec) {
            core::LogWarning("failed to discard " + item.path().string() + ": " +
                             remove_ec.message());
        }
    }
    if (ec) {
        core::LogWarning("failed to scan " + temp_path_ + ": " + ec.message());
    }
    return discarded;
}

bool ArtifactStore::IsSafeName(const std::string& name) {
    if (name.empty() || name.size() > 255) {
        return false;
    }
    for (char c : name) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.')) {
            return false;
        }
    }
    if (name == "." || name == "..") {
        return false;
    }
    return true;
}

}  // namespace chunkvault::storage
