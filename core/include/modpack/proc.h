#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace modpack {

struct ProcLimits {
    int timeout_ms{0};                  // 0 = no deadline
    size_t output_max_bytes{256 * 1024};

    // 0 disables the corresponding rlimit. Package managers spawn many
    // children and open many files, so nothing is capped by default.
    size_t rlimit_as_mb{0};
    size_t rlimit_fsize_mb{0};
    int rlimit_nofile{0};

    bool no_new_privs{true};
};

struct ProcResult {
    int exit_code{127};
    bool started{false};
    bool timed_out{false};
    bool output_truncated{false};
    std::string output; // stdout+stderr merged
    std::string error;  // internal runner error, not child stderr
};

// Run a process (argv[0] is resolved through PATH) inside cwd, capture
// stdout+stderr merged up to lim.output_max_bytes, and kill the whole process
// group once lim.timeout_ms elapses. Returns false if the process could not be
// started (res->error says why).
bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const ProcLimits& lim,
                      ProcResult* res);

// Split a command string into argv tokens.
// Supports basic quotes (single/double) and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

// Capability seam for the external tools. The pipeline only ever talks to
// this interface; tests substitute a scripted implementation.
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;
    virtual ProcResult run(const std::vector<std::string>& argv,
                           const std::string& cwd,
                           const ProcLimits& lim) = 0;
};

class SubprocessRunner final : public ICommandRunner {
public:
    ProcResult run(const std::vector<std::string>& argv,
                   const std::string& cwd,
                   const ProcLimits& lim) override;
};

} // namespace modpack
