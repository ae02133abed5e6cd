#pragma once

#include "artifact_registry.h"
#include "log.h"

#include <cstddef>
#include <cstdint>
#include <string>

#include <sys/types.h>

namespace modpack {

inline constexpr const char* kAttachmentName = "node_modules.tar.gz";
inline constexpr const char* kArchiveContentType = "application/gzip";

// Move-only owner of an open archive descriptor. Once open, the bytes stay
// readable even if the sweep unlinks the file underneath.
class ArtifactFile {
public:
    ArtifactFile() = default;
    ArtifactFile(int fd, uint64_t size) : fd_(fd), size_(size) {}
    ~ArtifactFile();
    ArtifactFile(ArtifactFile&& other) noexcept;
    ArtifactFile& operator=(ArtifactFile&& other) noexcept;
    ArtifactFile(const ArtifactFile&) = delete;
    ArtifactFile& operator=(const ArtifactFile&) = delete;

    bool is_open() const { return fd_ >= 0; }
    uint64_t size() const { return size_; }

    // read(2) semantics with EINTR retried.
    ssize_t read(char* buf, size_t n);

private:
    void close_fd();
    int fd_{-1};
    uint64_t size_{0};
};

struct DownloadResult {
    LookupStatus status{LookupStatus::NOT_FOUND};
    ArtifactFile file;   // open when status == LIVE
    std::string error;   // set when the file could not be opened for a non-race reason
};

class DownloadService {
public:
    DownloadService(ArtifactRegistry& registry, EventLog& events);

    // Resolve id and open the archive. Malformed ids are NOT_FOUND without a
    // registry lookup. If the file disappeared between lookup and open the
    // entry was evicted, which is reported as EXPIRED.
    DownloadResult open(const std::string& id);

private:
    ArtifactRegistry& registry_;
    EventLog& events_;
};

} // namespace modpack
