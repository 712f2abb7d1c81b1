#include "patchbench/proc.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <climits>
#include <csignal>
#include <cstring>
#include <mutex>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

namespace patchbench {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    bool have_token = false;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;

    for (char c : cmd) {
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                if (have_token) out.push_back(cur);
                cur.clear();
                have_token = false;
                continue;
            }
            if (c == '\'') { st = SQ; have_token = true; continue; }
            if (c == '"') { st = DQ; esc = false; have_token = true; continue; }
            cur.push_back(c);
            have_token = true;
        } else if (st == SQ) {
            if (c == '\'') { st = NORM; continue; }
            cur.push_back(c);
        } else {
            if (esc) {
                cur.push_back(c);
                esc = false;
                continue;
            }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { st = NORM; continue; }
            cur.push_back(c);
        }
    }
    if (st != NORM) return {};
    if (have_token) out.push_back(cur);
    return out;
}

int deadline_ms(long long timeout_sec) {
    if (timeout_sec <= 0) return 0;
    if (timeout_sec >= INT_MAX / 1000) return INT_MAX;
    return static_cast<int>(timeout_sec * 1000);
}

std::string shell_quote(const std::string& s) {
    if (s.empty()) return "''";
    bool plain = true;
    for (char c : s) {
        if (!(std::isalnum((unsigned char)c) || c == '_' || c == '-' || c == '.' || c == '/' ||
              c == ':' || c == '=' || c == ',' || c == '+' || c == '@')) {
            plain = false;
            break;
        }
    }
    if (plain) return s;
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out += "'";
    return out;
}

namespace {

void set_nonblock(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void append_capped(std::string& dst, const char* buf, size_t n, size_t cap, bool* truncated) {
    size_t can = cap > dst.size() ? (cap - dst.size()) : 0;
    if (n > can) {
        *truncated = true;
        n = can;
    }
    if (n > 0) dst.append(buf, n);
}

// Read whatever is available on fd. Returns false on EOF/error (fd should be closed).
bool drain_fd(int fd, std::string& dst, size_t cap, bool* truncated) {
    char buf[8192];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            append_capped(dst, buf, (size_t)n, cap, truncated);
            continue;
        }
        if (n == -1 && errno == EINTR) continue;
        if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
        return false;
    }
}

bool run_impl(const std::vector<std::string>& argv,
              const std::string& cwd,
              const std::string* stdin_data,
              const ProcLimits& lim,
              ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};

    // a child that exits before reading its stdin must not kill us with SIGPIPE
    static std::once_flag sigpipe_once;
    std::call_once(sigpipe_once, [] { (void)std::signal(SIGPIPE, SIG_IGN); });

    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int in_pipe[2] = {-1, -1};
    auto close_all = [&]() {
        for (int* p : {out_pipe, err_pipe, in_pipe}) {
            if (p[0] >= 0) close(p[0]);
            if (p[1] >= 0) close(p[1]);
            p[0] = p[1] = -1;
        }
    };

    if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0 || (stdin_data && pipe(in_pipe) != 0)) {
        res->error = std::string("pipe failed: ") + std::strerror(errno);
        close_all();
        return false;
    }

    auto start = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        res->error = std::string("fork failed: ") + std::strerror(errno);
        close_all();
        return false;
    }

    if (pid == 0) {
        // child
        if (stdin_data) {
            (void)dup2(in_pipe[0], STDIN_FILENO);
        } else {
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) (void)dup2(devnull, STDIN_FILENO);
        }
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(err_pipe[1], STDERR_FILENO);

        // own process group so the deadline can kill the whole subtree
        (void)setpgid(0, 0);

        long maxfd = sysconf(_SC_OPEN_MAX);
        if (maxfd < 256) maxfd = 256;
        for (int fd = 3; fd < maxfd; fd++) (void)close(fd);

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) _exit(126);

#ifdef __linux__
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

        std::vector<char*> cargv;
        cargv.reserve(argv.size() + 1);
        for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
        cargv.push_back(nullptr);
        execvp(cargv[0], cargv.data());
        _exit(127);
    }

    // parent
    (void)setpgid(pid, pid);
    close(out_pipe[1]); out_pipe[1] = -1;
    close(err_pipe[1]); err_pipe[1] = -1;

    int in_fd = -1;
    if (stdin_data) {
        close(in_pipe[0]); in_pipe[0] = -1;
        in_fd = in_pipe[1];
        in_pipe[1] = -1;
        if (stdin_data->empty()) {
            close(in_fd);
            in_fd = -1;
        } else {
            set_nonblock(in_fd);
        }
    }
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    set_nonblock(out_fd);
    set_nonblock(err_fd);

    size_t write_off = 0;
    bool child_exited = false;
    int status = 0;

    auto elapsed_ms = [&]() -> long long {
        return (long long)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
    };

    while (true) {
        if (!child_exited) {
            pid_t w = waitpid(pid, &status, WNOHANG);
            if (w == pid) child_exited = true;
        }
        // after exit keep reading until both pipes hit EOF (grandchildren may
        // still hold them; the deadline below bounds that too)
        if (child_exited && out_fd < 0 && err_fd < 0) break;

        long long el = elapsed_ms();
        if (lim.timeout_ms > 0 && el >= lim.timeout_ms) {
            // also reaps leftovers of an exited child still holding the pipes
            (void)kill(-pid, SIGKILL);
            if (!child_exited) {
                res->timed_out = true;
                (void)kill(pid, SIGKILL);
                (void)waitpid(pid, &status, 0);
                child_exited = true;
            }
            break;
        }

        struct pollfd fds[3];
        nfds_t nfds = 0;
        int in_idx = -1, out_idx = -1, err_idx = -1;
        if (in_fd >= 0) { in_idx = (int)nfds; fds[nfds++] = {in_fd, POLLOUT, 0}; }
        if (out_fd >= 0) { out_idx = (int)nfds; fds[nfds++] = {out_fd, POLLIN, 0}; }
        if (err_fd >= 0) { err_idx = (int)nfds; fds[nfds++] = {err_fd, POLLIN, 0}; }

        int slice = 50;
        if (lim.timeout_ms > 0) {
            long long remaining = lim.timeout_ms - el;
            if (remaining < slice) slice = (int)std::max<long long>(1, remaining);
        }
        int pr = nfds > 0 ? poll(fds, nfds, slice) : poll(nullptr, 0, slice);
        if (pr < 0 && errno == EINTR) continue;

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            while (write_off < stdin_data->size()) {
                ssize_t n = write(in_fd, stdin_data->data() + write_off, stdin_data->size() - write_off);
                if (n > 0) { write_off += (size_t)n; continue; }
                if (n == -1 && errno == EINTR) continue;
                if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                write_off = stdin_data->size(); // EPIPE: child stopped reading
                break;
            }
            if (write_off >= stdin_data->size()) {
                close(in_fd);
                in_fd = -1;
            }
        }
        if (out_idx >= 0 && fds[out_idx].revents) {
            if (!drain_fd(out_fd, res->stdout_text, lim.stdout_max_bytes, &res->stdout_truncated)) {
                close(out_fd);
                out_fd = -1;
            }
        }
        if (err_idx >= 0 && fds[err_idx].revents) {
            if (!drain_fd(err_fd, res->stderr_text, lim.stderr_max_bytes, &res->stderr_truncated)) {
                close(err_fd);
                err_fd = -1;
            }
        }
    }

    if (in_fd >= 0) close(in_fd);
    if (out_fd >= 0) {
        (void)drain_fd(out_fd, res->stdout_text, lim.stdout_max_bytes, &res->stdout_truncated);
        close(out_fd);
    }
    if (err_fd >= 0) {
        (void)drain_fd(err_fd, res->stderr_text, lim.stderr_max_bytes, &res->stderr_truncated);
        close(err_fd);
    }

    res->duration_ms = elapsed_ms();
    if (WIFEXITED(status)) res->exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) res->exit_code = 128 + WTERMSIG(status);
    else res->exit_code = 128;
    return true;
}

} // namespace

bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const ProcLimits& lim,
                      ProcResult* res) {
    return run_impl(argv, cwd, nullptr, lim, res);
}

bool proc_run_capture_stdin(const std::vector<std::string>& argv,
                            const std::string& cwd,
                            const std::string& stdin_data,
                            const ProcLimits& lim,
                            ProcResult* res) {
    return run_impl(argv, cwd, &stdin_data, lim, res);
}

} // namespace patchbench
