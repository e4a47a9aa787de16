#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "chunkvault/core/error.h"
#include "chunkvault/core/result.h"
#include "chunkvault/transfer/chunk_codec.h"

namespace chunkvault::storage {

/// @brief Location and size of a published artifact.
struct StoredArtifact {
    std::string path;
    std::uint64_t size_bytes{0};
};

/// @brief Append-only temp file that becomes an artifact on commit.
/// Removed on destruction unless it was committed.
class ArtifactWriter {
public:
    /// Only ArtifactStore can open writers.
    class OpenToken {
        friend class ArtifactStore;
        OpenToken() {}
    };

    ArtifactWriter(OpenToken, int fd, std::string temp_path);
    ~ArtifactWriter();
    ArtifactWriter(const ArtifactWriter&) = delete;
    ArtifactWriter& operator=(const ArtifactWriter&) = delete;

    core::Result<void> Append(const char* data, std::size_t size);
    std::uint64_t bytes_written() const { return written_; }

private:
    friend class ArtifactStore;

    int fd_{-1};
    std::string temp_path_;
    std::uint64_t written_{0};
    bool committed_{false};
};

/// @brief Local filesystem home of assembled files with atomic publication.
class ArtifactStore {
public:
    ArtifactStore(std::string base_path, std::string temp_path);

    core::Result<std::unique_ptr<ArtifactWriter>> BeginWrite();
    /// fsyncs the temp file and renames it over the artifact path.
    core::Result<StoredArtifact> Commit(ArtifactWriter& writer, const std::string& owner,
                                        const std::string& filename);
    core::Result<StoredArtifact> Stat(const std::string& owner, const std::string& filename) const;
    core::Result<std::string> ReadRange(const std::string& owner, const std::string& filename,
                                        const transfer::ByteRange& range) const;
    core::Result<void> Delete(const std::string& owner, const std::string& filename);
    /// Removes assembly temp files left behind by an interrupted process.
    std::size_t DiscardStaleTemps();

    std::string ArtifactPath(const std::string& owner, const std::string& filename) const;
    const std::string& base_path() const { return base_path_; }
    const std::string& temp_path() const { return temp_path_; }

    static bool IsSafeName(const std::string& name);

private:
    std::string base_path_;
    std::string temp_path_;
};

}  // namespace chunkvault::storage
