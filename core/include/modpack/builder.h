#pragma once

#include "proc.h"
#include "workspace.h"

#include <filesystem>
#include <string>
#include <vector>

namespace modpack {

// Result of one external tool invocation. Failures are values, not exceptions:
// a bad manifest failing the installer is an expected outcome.
struct ToolOutcome {
    bool ok{false};
    int exit_code{-1};
    bool timed_out{false};
    std::string diagnostics; // captured output, bounded, truncation marked
};

// Appends a marker when the capture hit its cap.
std::string bounded_diagnostics(const ProcResult& pr, size_t cap);

// Runs the dependency installer with the workspace as cwd. argv comes from
// configuration (e.g. {"bun","install","--no-save","--no-progress"}); it must
// not write back to shared lockfiles. Never retried here.
class BuildExecutor {
public:
    BuildExecutor(ICommandRunner& runner, std::vector<std::string> argv, ProcLimits lim);

    ToolOutcome install(const Workspace& ws);

private:
    ICommandRunner& runner_;
    std::vector<std::string> argv_;
    ProcLimits lim_;
};

// Packs <ws>/node_modules into <ws>/node_modules.tar.gz. argv is the tool
// prefix (e.g. {"tar","-czf"}); archive name and input dir are appended.
class Archiver {
public:
    Archiver(ICommandRunner& runner, std::vector<std::string> argv, ProcLimits lim);

    // Precondition: a successful install() on ws (the install dir exists).
    // Violating it throws std::logic_error.
    ToolOutcome compress(const Workspace& ws);

private:
    ICommandRunner& runner_;
    std::vector<std::string> argv_;
    ProcLimits lim_;
};

} // namespace modpack
