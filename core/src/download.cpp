#include "modpack/download.h"
#include "modpack/crypto.h"
#include "modpack/json_doc.h"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace modpack {

ArtifactFile::~ArtifactFile() { close_fd(); }

ArtifactFile::ArtifactFile(ArtifactFile&& other) noexcept : fd_(other.fd_), size_(other.size_) {
    other.fd_ = -1;
    other.size_ = 0;
}

ArtifactFile& ArtifactFile::operator=(ArtifactFile&& other) noexcept {
    if (this != &other) {
        close_fd();
        fd_ = other.fd_;
        size_ = other.size_;
        other.fd_ = -1;
        other.size_ = 0;
    }
    return *this;
}

void ArtifactFile::close_fd() {
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
}

ssize_t ArtifactFile::read(char* buf, size_t n) {
    while (true) {
        ssize_t r = ::read(fd_, buf, n);
        if (r < 0 && errno == EINTR) continue;
        return r;
    }
}

DownloadService::DownloadService(ArtifactRegistry& registry, EventLog& events)
    : registry_(registry), events_(events) {}

DownloadResult DownloadService::open(const std::string& id) {
    DownloadResult r;
    if (!is_token_hex(id, 32)) {
        r.status = LookupStatus::NOT_FOUND;
        return r;
    }

    Lookup lk = registry_.take_if_live(id);
    r.status = lk.status;
    if (lk.status != LookupStatus::LIVE) {
        json_object* p = json_object_new_object();
        json_doc::add_string(p, "status", lookup_status_name(lk.status));
        events_.event("download.miss", p);
        return r;
    }

    int fd = ::open(lk.entry.path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) {
            r.status = LookupStatus::EXPIRED;
        } else {
            r.status = LookupStatus::NOT_FOUND;
            r.error = std::string("open failed: ") + std::strerror(errno);
        }
        return r;
    }
    struct stat sb;
    if (::fstat(fd, &sb) != 0) {
        r.error = std::string("fstat failed: ") + std::strerror(errno);
        ::close(fd);
        r.status = LookupStatus::NOT_FOUND;
        return r;
    }
    r.file = ArtifactFile(fd, (uint64_t)sb.st_size);

    json_object* p = json_object_new_object();
    json_doc::add_string(p, "id_prefix", id.substr(0, 8));
    json_doc::add_int(p, "bytes", (int64_t)sb.st_size);
    events_.event("download.ok", p);
    return r;
}

} // namespace modpack
