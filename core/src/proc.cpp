#include "modpack/proc.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>

#ifndef _WIN32
  #include <unistd.h>
  #include <fcntl.h>
  #include <signal.h>
  #include <sys/types.h>
  #include <sys/wait.h>
  #include <sys/resource.h>
  #include <poll.h>
  #ifdef __linux__
    #include <sys/prctl.h>
  #endif
#endif

namespace modpack {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string tok;
    bool in_tok = false;
    char quote = 0; // 0, '\'' or '"'

    for (size_t i = 0; i < cmd.size(); i++) {
        const char c = cmd[i];
        if (quote == '\'') {
            if (c == '\'') quote = 0;
            else tok.push_back(c);
            continue;
        }
        if (quote == '"') {
            if (c == '\\' && i + 1 < cmd.size()) tok.push_back(cmd[++i]);
            else if (c == '"') quote = 0;
            else tok.push_back(c);
            continue;
        }
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            if (in_tok) out.push_back(std::move(tok));
            tok.clear();
            in_tok = false;
            continue;
        }
        in_tok = true;
        if (c == '\'' || c == '"') quote = c;
        else tok.push_back(c);
    }
    if (quote != 0) return {};
    if (in_tok) out.push_back(std::move(tok));
    return out;
}

#ifndef _WIN32
namespace {

// Bounded sink for the child's merged stdout/stderr.
class OutputSink {
public:
    explicit OutputSink(size_t cap) : cap_(cap) {}

    void take(const char* buf, size_t n) {
        const size_t room = cap_ > data_.size() ? cap_ - data_.size() : 0;
        if (n > room) truncated_ = true;
        data_.append(buf, std::min(n, room));
    }

    // Read whatever the pipe holds right now. False once the writer side is closed.
    bool pull(int fd) {
        char buf[8192];
        for (;;) {
            ssize_t n = ::read(fd, buf, sizeof(buf));
            if (n > 0) { take(buf, (size_t)n); continue; }
            if (n < 0 && errno == EINTR) continue;
            return n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK);
        }
    }

    std::string& data() { return data_; }
    bool truncated() const { return truncated_; }

private:
    size_t cap_;
    std::string data_;
    bool truncated_{false};
};

// Only async-signal-safe calls between fork and exec.
void write_child_error(const char* what, int err) {
    const char* msg = std::strerror(err);
    (void)!::write(STDERR_FILENO, what, std::strlen(what));
    (void)!::write(STDERR_FILENO, ": ", 2);
    (void)!::write(STDERR_FILENO, msg, std::strlen(msg));
    (void)!::write(STDERR_FILENO, "\n", 1);
}

void apply_rlimit(int resource, rlim_t v) {
    struct rlimit rl;
    rl.rlim_cur = v;
    rl.rlim_max = v;
    (void)::setrlimit(resource, &rl);
}

[[noreturn]] void exec_child(char* const* cargv, int out_fd, const std::string& cwd, const ProcLimits& lim) {
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) { (void)::dup2(devnull, STDIN_FILENO); ::close(devnull); }
    (void)::dup2(out_fd, STDOUT_FILENO);
    (void)::dup2(out_fd, STDERR_FILENO);

    // new process group: a deadline kill takes every helper the tool spawned
    (void)::setpgid(0, 0);

    long maxfd = ::sysconf(_SC_OPEN_MAX);
    if (maxfd < 256 || maxfd > 65536) maxfd = 65536;
    for (int fd = 3; fd < maxfd; fd++) (void)::close(fd);

    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
        write_child_error("chdir failed", errno);
        _exit(126);
    }

#ifdef __linux__
    if (lim.no_new_privs) (void)::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
    (void)::prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif
    if (lim.rlimit_as_mb > 0) apply_rlimit(RLIMIT_AS, (rlim_t)lim.rlimit_as_mb << 20);
    if (lim.rlimit_fsize_mb > 0) apply_rlimit(RLIMIT_FSIZE, (rlim_t)lim.rlimit_fsize_mb << 20);
    if (lim.rlimit_nofile > 0) apply_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile);

    ::execvp(cargv[0], cargv);
    write_child_error(cargv[0], errno);
    _exit(127);
}

int exit_code_of(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 128;
}

// Collect output until the child exits or the deadline passes. Returns the wait status.
int supervise(pid_t pid, int rfd, const ProcLimits& lim, OutputSink& sink, bool* timed_out) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(lim.timeout_ms);
    bool pipe_open = true;
    int status = 0;

    for (;;) {
        if (pipe_open) pipe_open = sink.pull(rfd);
        if (::waitpid(pid, &status, WNOHANG) == pid) return status;

        int wait_ms = 50;
        if (lim.timeout_ms > 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
            if (left <= 0) {
                *timed_out = true;
                (void)::kill(-pid, SIGKILL);
                (void)::kill(pid, SIGKILL);
                while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
                return status;
            }
            wait_ms = (int)std::min<long long>(wait_ms, left);
        }

        if (pipe_open) {
            struct pollfd pfd;
            pfd.fd = rfd;
            pfd.events = POLLIN;
            (void)::poll(&pfd, 1, wait_ms);
        } else {
            // output closed, process still running
            ::usleep((useconds_t)wait_ms * 1000);
        }
    }
}

} // namespace
#endif

bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const ProcLimits& lim,
                      ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};

#ifdef _WIN32
    res->error = "proc_run_capture: not supported on Windows";
    return false;
#else
    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    // MODPACK_PROC_WRAPPER (e.g. "bwrap --unshare-net ...") is prepended verbatim.
    std::vector<std::string> full = argv;
    if (const char* w = std::getenv("MODPACK_PROC_WRAPPER")) {
        std::vector<std::string> prefix = split_argv_quoted(w);
        full.insert(full.begin(), prefix.begin(), prefix.end());
    }

    // materialized before fork: the child must not allocate
    std::vector<char*> cargv;
    cargv.reserve(full.size() + 1);
    for (auto& s : full) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) != 0) {
        res->error = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }
    int fl = ::fcntl(pipefd[0], F_GETFL, 0);
    if (fl >= 0) (void)::fcntl(pipefd[0], F_SETFL, fl | O_NONBLOCK);

    pid_t pid = ::fork();
    if (pid < 0) {
        res->error = std::string("fork failed: ") + std::strerror(errno);
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return false;
    }
    if (pid == 0) exec_child(cargv.data(), pipefd[1], cwd, lim);

    (void)::setpgid(pid, pid);
    ::close(pipefd[1]);
    res->started = true;

    OutputSink sink(lim.output_max_bytes);
    int status = supervise(pid, pipefd[0], lim, sink, &res->timed_out);

    // grandchildren may keep the write end open; take only what is already buffered
    (void)sink.pull(pipefd[0]);
    ::close(pipefd[0]);

    res->exit_code = exit_code_of(status);
    res->output = std::move(sink.data());
    res->output_truncated = sink.truncated();
    return true;
#endif
}

ProcResult SubprocessRunner::run(const std::vector<std::string>& argv,
                                 const std::string& cwd,
                                 const ProcLimits& lim) {
    ProcResult res;
    if (!proc_run_capture(argv, cwd, lim, &res) && res.error.empty()) res.error = "could not start process";
    return res;
}

} // namespace modpack
