#include "modpack/builder.h"

#include <stdexcept>
#include <system_error>

namespace modpack {

namespace {

ToolOutcome to_outcome(const ProcResult& pr, size_t cap, const std::string& tool, int timeout_ms) {
    ToolOutcome o;
    o.exit_code = pr.exit_code;
    o.timed_out = pr.timed_out;
    if (!pr.started) {
        o.ok = false;
        o.diagnostics = tool + " could not be started: " + pr.error;
        return o;
    }
    o.diagnostics = bounded_diagnostics(pr, cap);
    if (pr.timed_out) {
        o.ok = false;
        o.diagnostics += "\n[" + tool + " timed out after " + std::to_string(timeout_ms) + " ms and was killed]";
        return o;
    }
    o.ok = (pr.exit_code == 0);
    return o;
}

} // namespace

std::string bounded_diagnostics(const ProcResult& pr, size_t cap) {
    std::string s = pr.output;
    bool cut = pr.output_truncated;
    if (s.size() > cap) {
        s.resize(cap);
        cut = true;
    }
    if (cut) s += "\n[... output truncated at " + std::to_string(cap) + " bytes]";
    return s;
}

BuildExecutor::BuildExecutor(ICommandRunner& runner, std::vector<std::string> argv, ProcLimits lim)
    : runner_(runner), argv_(std::move(argv)), lim_(lim) {
    if (argv_.empty()) throw std::invalid_argument("BuildExecutor: empty install command");
}

ToolOutcome BuildExecutor::install(const Workspace& ws) {
    ProcResult pr = runner_.run(argv_, ws.dir.string(), lim_);
    ToolOutcome o = to_outcome(pr, lim_.output_max_bytes, argv_[0], lim_.timeout_ms);
    if (!o.ok) return o;

    // A manifest without dependencies installs nothing; still archive an empty tree.
    std::error_code ec;
    std::filesystem::create_directories(ws.install_dir(), ec);
    if (ec) {
        o.ok = false;
        o.diagnostics += "\ninstall dir missing and could not be created: " + ec.message();
    }
    return o;
}

Archiver::Archiver(ICommandRunner& runner, std::vector<std::string> argv, ProcLimits lim)
    : runner_(runner), argv_(std::move(argv)), lim_(lim) {
    if (argv_.empty()) throw std::invalid_argument("Archiver: empty archive command");
}

ToolOutcome Archiver::compress(const Workspace& ws) {
    std::error_code ec;
    if (!std::filesystem::is_directory(ws.install_dir(), ec)) {
        throw std::logic_error("Archiver::compress called without a successful install in " + ws.dir.string());
    }

    std::vector<std::string> argv = argv_;
    argv.push_back(kArchiveFile);
    argv.push_back(kInstallDir);
    ProcResult pr = runner_.run(argv, ws.dir.string(), lim_);
    ToolOutcome o = to_outcome(pr, lim_.output_max_bytes, argv_[0], lim_.timeout_ms);
    if (!o.ok) return o;

    if (!std::filesystem::is_regular_file(ws.archive_path(), ec)) {
        o.ok = false;
        o.diagnostics += "\n" + argv_[0] + " exited 0 but produced no " + kArchiveFile;
    }
    return o;
}

} // namespace modpack
