#pragma once

#include <filesystem>
#include <string>

namespace modpack {

inline constexpr const char* kManifestFile = "package.json";
inline constexpr const char* kInstallDir = "node_modules";
inline constexpr const char* kArchiveFile = "node_modules.tar.gz";
inline constexpr const char* kWorkspacePrefix = "mp-";

// One build's private directory. Layout:
//   <dir>/package.json          manifest as submitted
//   <dir>/node_modules/         installed tree (after install)
//   <dir>/node_modules.tar.gz   archive (after compress)
struct Workspace {
    std::filesystem::path dir;

    std::filesystem::path manifest_path() const { return dir / kManifestFile; }
    std::filesystem::path install_dir() const { return dir / kInstallDir; }
    std::filesystem::path archive_path() const { return dir / kArchiveFile; }
};

class WorkspaceProvisioner {
public:
    explicit WorkspaceProvisioner(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }

    // Fresh, exclusively-named empty directory under root (mode 0700).
    // Throws ProvisionError.
    Workspace create() const;

    // Throws WriteError.
    void write_manifest(const Workspace& ws, const std::string& content) const;

    // Remove every leftover workspace directory under root. Only valid when no
    // build is in flight (startup). Returns the number removed.
    size_t purge_orphans() const;

    // Recursive removal. Missing directory is not an error; returns false only
    // when something was there and could not be removed.
    static bool destroy(const std::filesystem::path& dir);
    static bool destroy(const Workspace& ws) { return destroy(ws.dir); }

private:
    std::filesystem::path root_;
};

// Destroys the workspace on scope exit unless release()d.
class WorkspaceGuard {
public:
    explicit WorkspaceGuard(Workspace ws) : ws_(std::move(ws)) {}
    ~WorkspaceGuard() {
        if (armed_) WorkspaceProvisioner::destroy(ws_);
    }
    WorkspaceGuard(const WorkspaceGuard&) = delete;
    WorkspaceGuard& operator=(const WorkspaceGuard&) = delete;

    const Workspace& get() const { return ws_; }
    void release() { armed_ = false; }

private:
    Workspace ws_;
    bool armed_{true};
};

} // namespace modpack
