#include "scrapeguard/proc.h"
#include "scrapeguard/sandbox.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>

#ifndef _WIN32
  #include <fcntl.h>
  #include <poll.h>
  #include <pthread.h>
  #include <signal.h>
  #include <sys/resource.h>
  #include <sys/stat.h>
  #include <sys/types.h>
  #include <sys/wait.h>
  #include <time.h>
  #include <unistd.h>
  #ifdef __linux__
    #include <sys/prctl.h>
  #endif
#endif

namespace scrapeguard {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    bool have_token = false;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;

    for (char c : cmd) {
        switch (st) {
        case NORM:
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                if (have_token) out.push_back(std::move(cur));
                cur.clear();
                have_token = false;
            } else if (c == '\'') {
                st = SQ;
                have_token = true;
            } else if (c == '"') {
                st = DQ;
                esc = false;
                have_token = true;
            } else {
                cur.push_back(c);
                have_token = true;
            }
            break;
        case SQ:
            if (c == '\'') st = NORM;
            else cur.push_back(c);
            break;
        case DQ:
            if (esc) {
                cur.push_back(c);
                esc = false;
            } else if (c == '\\') {
                esc = true;
            } else if (c == '"') {
                st = NORM;
            } else {
                cur.push_back(c);
            }
            break;
        }
    }
    if (st != NORM) return {};
    if (have_token) out.push_back(std::move(cur));
    return out;
}

#ifndef _WIN32

namespace {

bool env_true(const char* key) {
    const char* v = std::getenv(key);
    if (!v) return false;
    std::string s = v;
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return s == "1" || s == "true" || s == "yes" || s == "on";
}

// Optional operator-provided wrapper (nsjail, firejail, bwrap), prepended
// to argv. Disabled unless explicitly enabled.
std::vector<std::string> wrap_argv(const std::vector<std::string>& argv) {
    if (!env_true("SCRAPEGUARD_PROC_WRAPPER_ENABLE")) return argv;
    const char* w = std::getenv("SCRAPEGUARD_PROC_WRAPPER");
    if (!w) return argv;
    std::vector<std::string> merged = split_argv_quoted(w);
    if (merged.empty()) return argv;
    merged.insert(merged.end(), argv.begin(), argv.end());
    return merged;
}

void set_rlimit(int resource, rlim_t v) {
    struct rlimit rl;
    rl.rlim_cur = v;
    rl.rlim_max = v;
    (void)setrlimit(resource, &rl);
}

// Runs in the forked child; never returns.
[[noreturn]] void exec_child(const std::vector<std::string>& argv,
                             const std::string& cwd,
                             const ProcLimits& lim,
                             int in_fd, int out_fd) {
    if (in_fd >= 0) {
        (void)dup2(in_fd, STDIN_FILENO);
    } else {
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) (void)dup2(devnull, STDIN_FILENO);
    }
    (void)dup2(out_fd, STDOUT_FILENO);
    if (lim.merge_stderr) {
        (void)dup2(out_fd, STDERR_FILENO);
    } else {
        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) (void)dup2(devnull, STDERR_FILENO);
    }

    // own process group so timeout/cancel can kill the whole subtree
    (void)setpgid(0, 0);
    (void)umask(077);

    long maxfd = sysconf(_SC_OPEN_MAX);
    if (maxfd < 256) maxfd = 256;
    for (int fd = 3; fd < maxfd; fd++) (void)close(fd);

    if (!cwd.empty() && chdir(cwd.c_str()) != 0) _exit(126);

    unsetenv("LD_PRELOAD");
    unsetenv("LD_LIBRARY_PATH");

#ifdef __linux__
    if (lim.no_new_privs) (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
    (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

    if (lim.rlimit_cpu_sec > 0) set_rlimit(RLIMIT_CPU, (rlim_t)lim.rlimit_cpu_sec);
    if (lim.rlimit_as_mb > 0) set_rlimit(RLIMIT_AS, (rlim_t)lim.rlimit_as_mb * 1024ULL * 1024ULL);
    if (lim.rlimit_fsize_mb > 0) set_rlimit(RLIMIT_FSIZE, (rlim_t)lim.rlimit_fsize_mb * 1024ULL * 1024ULL);
    if (lim.rlimit_nofile > 0) set_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile);
#ifdef RLIMIT_NPROC
    if (lim.rlimit_nproc > 0) set_rlimit(RLIMIT_NPROC, (rlim_t)lim.rlimit_nproc);
#endif

    // after no_new_privs; a child that asked for seccomp and cannot get it
    // does not run unconfined
    if (lim.enable_seccomp) {
        std::string err = install_seccomp_filter(lim.seccomp_profile);
        if (!err.empty()) _exit(125);
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);
    execvp(cargv[0], cargv.data());
    _exit(127);
}

void set_nonblock(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// write() to a pipe whose reader may already be gone. SIGPIPE is blocked for
// the call and a SIGPIPE it raised is consumed, so the caller sees EPIPE
// whatever the process-wide disposition is.
ssize_t write_pipe(int fd, const char* buf, size_t len) {
    sigset_t pipe_set, old_set, pending;
    sigemptyset(&pipe_set);
    sigaddset(&pipe_set, SIGPIPE);
    sigemptyset(&pending);
    (void)sigpending(&pending);
    const bool was_pending = sigismember(&pending, SIGPIPE) == 1;
    (void)pthread_sigmask(SIG_BLOCK, &pipe_set, &old_set);

    ssize_t n = write(fd, buf, len);
    const int saved = errno;

    if (n == -1 && saved == EPIPE && !was_pending) {
        struct timespec zero = {0, 0};
        while (sigtimedwait(&pipe_set, nullptr, &zero) == -1 && errno == EINTR) {}
    }
    (void)pthread_sigmask(SIG_SETMASK, &old_set, nullptr);
    errno = saved;
    return n;
}

bool run_capture(const std::vector<std::string>& argv,
                 const std::string& cwd,
                 const std::string* stdin_data,
                 const ProcLimits& lim,
                 ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};

    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }
    const std::vector<std::string> eff_argv = wrap_argv(argv);

    int out_pipe[2];
    if (pipe(out_pipe) != 0) {
        res->error = std::string("pipe(out) failed: ") + std::strerror(errno);
        return false;
    }
    int in_pipe[2] = {-1, -1};
    if (stdin_data && pipe(in_pipe) != 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        res->error = std::string("pipe(in) failed: ") + std::strerror(errno);
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        if (in_pipe[0] >= 0) { close(in_pipe[0]); close(in_pipe[1]); }
        res->error = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }
    if (pid == 0) {
        exec_child(eff_argv, cwd, lim, in_pipe[0], out_pipe[1]);
    }

    // parent
    (void)setpgid(pid, pid);
    close(out_pipe[1]);
    set_nonblock(out_pipe[0]);

    int in_fd = -1;
    if (stdin_data) {
        close(in_pipe[0]);
        in_fd = in_pipe[1];
        if (stdin_data->empty()) {
            close(in_fd);
            in_fd = -1;
        } else {
            set_nonblock(in_fd);
        }
    }
    size_t write_off = 0;

    std::string out;
    out.reserve(std::min<size_t>(lim.stdout_max_bytes, 64 * 1024));
    auto append = [&](const char* buf, ssize_t n) {
        size_t can = lim.stdout_max_bytes > out.size() ? lim.stdout_max_bytes - out.size() : 0;
        size_t take = std::min(can, (size_t)n);
        if (take < (size_t)n) res->output_truncated = true;
        out.append(buf, take);
    };
    bool out_open = true;
    auto drain = [&]() {
        char buf[4096];
        while (true) {
            ssize_t n = read(out_pipe[0], buf, sizeof(buf));
            if (n > 0) { append(buf, n); continue; }
            if (n == -1 && errno == EINTR) continue;
            if (n == 0) out_open = false;
            break;
        }
    };
    auto kill_group = [&]() {
        (void)kill(-pid, SIGKILL);
        (void)kill(pid, SIGKILL);
    };

    const auto start = std::chrono::steady_clock::now();
    bool child_exited = false;
    int status = 0;

    while (true) {
        if (lim.cancel && lim.cancel->load()) {
            res->cancelled = true;
            kill_group();
            (void)waitpid(pid, &status, 0);
            child_exited = true;
            break;
        }

        int elapsed_ms = (int)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        int slice = 50;
        if (lim.timeout_ms > 0) {
            int remaining = lim.timeout_ms - elapsed_ms;
            if (remaining <= 0) {
                res->timed_out = true;
                kill_group();
                (void)waitpid(pid, &status, 0);
                child_exited = true;
                break;
            }
            slice = std::min(slice, remaining);
        }

        struct pollfd fds[2];
        nfds_t nfds = 0;
        int in_idx = -1;
        if (in_fd >= 0) {
            in_idx = (int)nfds;
            fds[nfds].fd = in_fd;
            fds[nfds].events = POLLOUT;
            fds[nfds].revents = 0;
            nfds++;
        }
        int out_idx = -1;
        if (out_open) {
            out_idx = (int)nfds;
            fds[nfds].fd = out_pipe[0];
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            nfds++;
        }

        int pr = poll(fds, nfds, slice);
        if (pr < 0 && errno == EINTR) continue;

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            while (write_off < stdin_data->size()) {
                ssize_t n = write_pipe(in_fd, stdin_data->data() + write_off, stdin_data->size() - write_off);
                if (n > 0) { write_off += (size_t)n; continue; }
                if (n == -1 && errno == EINTR) continue;
                if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                write_off = stdin_data->size(); // EPIPE: reader gone; stop writing
                break;
            }
            if (write_off >= stdin_data->size()) {
                close(in_fd);
                in_fd = -1;
            }
        }
        if (out_idx >= 0 && (fds[out_idx].revents & (POLLIN | POLLERR | POLLHUP))) drain();

        if (waitpid(pid, &status, WNOHANG) == pid) {
            child_exited = true;
            break;
        }
    }

    if (in_fd >= 0) close(in_fd);
    if (lim.kill_group_on_exit) (void)kill(-pid, SIGKILL);
    if (out_open) drain();
    close(out_pipe[0]);

    res->output = std::move(out);
    if (!child_exited) {
        res->exit_code = 128;
        res->error = "child did not exit";
    } else if (WIFEXITED(status)) {
        res->exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        res->exit_code = 128 + WTERMSIG(status);
    } else {
        res->exit_code = 128;
    }
    return true;
}

} // namespace

bool proc_run_capture_sandboxed(const std::vector<std::string>& argv,
                               const std::string& cwd,
                               const ProcLimits& lim,
                               ProcResult* res) {
    return run_capture(argv, cwd, nullptr, lim, res);
}

bool proc_run_capture_sandboxed_stdin(const std::vector<std::string>& argv,
                                     const std::string& cwd,
                                     const std::string& stdin_data,
                                     const ProcLimits& lim,
                                     ProcResult* res) {
    return run_capture(argv, cwd, &stdin_data, lim, res);
}

#else // _WIN32

bool proc_run_capture_sandboxed(const std::vector<std::string>&, const std::string&,
                               const ProcLimits&, ProcResult* res) {
    if (res) {
        *res = ProcResult{};
        res->error = "process isolation is not supported on Windows";
    }
    return false;
}

bool proc_run_capture_sandboxed_stdin(const std::vector<std::string>&, const std::string&,
                                     const std::string&, const ProcLimits&, ProcResult* res) {
    if (res) {
        *res = ProcResult{};
        res->error = "process isolation is not supported on Windows";
    }
    return false;
}

#endif

} // namespace scrapeguard
