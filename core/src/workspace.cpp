#include "modpack/workspace.h"
#include "modpack/errors.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <system_error>
#include <vector>

#include <stdlib.h>
#include <unistd.h>

namespace modpack {

WorkspaceProvisioner::WorkspaceProvisioner(std::filesystem::path root) : root_(std::move(root)) {}

Workspace WorkspaceProvisioner::create() const {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        throw ProvisionError("cannot create work root " + root_.string() + ": " + ec.message());
    }

    std::string tmpl = (root_ / (std::string(kWorkspacePrefix) + "XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (::mkdtemp(buf.data()) == nullptr) {
        throw ProvisionError("mkdtemp under " + root_.string() + " failed: " + std::strerror(errno));
    }
    return Workspace{std::filesystem::path(buf.data())};
}

void WorkspaceProvisioner::write_manifest(const Workspace& ws, const std::string& content) const {
    const auto p = ws.manifest_path();
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    if (!f) throw WriteError("cannot open " + p.string() + " for writing");
    f.write(content.data(), (std::streamsize)content.size());
    f.flush();
    if (!f) throw WriteError("short write to " + p.string());
}

bool WorkspaceProvisioner::destroy(const std::filesystem::path& dir) {
    if (dir.empty()) return true;
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        std::cerr << "[WARN] workspace cleanup failed for " << dir << ": " << ec.message() << "\n";
        return false;
    }
    return true;
}

size_t WorkspaceProvisioner::purge_orphans() const {
    size_t n = 0;
    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) return 0;
    for (auto& de : std::filesystem::directory_iterator(root_, ec)) {
        if (ec) break;
        if (!de.is_directory(ec)) continue;
        auto name = de.path().filename().string();
        if (name.rfind(kWorkspacePrefix, 0) != 0) continue;
        if (destroy(de.path())) n++;
    }
    return n;
}

} // namespace modpack
