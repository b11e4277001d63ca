#include "cordon/proc.h"
#include "cordon/capture.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

namespace cordon {

namespace {

void set_rlimit(int resource, rlim_t soft, rlim_t hard) {
    struct rlimit rl;
    rl.rlim_cur = soft;
    rl.rlim_max = hard;
    (void)setrlimit(resource, &rl);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

struct Pipes {
    int in[2]{-1, -1};
    int out[2]{-1, -1};
    int err[2]{-1, -1};
    int status[2]{-1, -1};

    void close_all() {
        for (int* p : {in, out, err, status}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    }
};

// Runs in the forked child. Only async-signal-safe calls past this point.
[[noreturn]] void exec_child(const Pipes& p, pid_t parent, const ResourceLimits& lim,
                             char* const* argv, char* const* envp) {
    // Park the child ends above the protocol descriptors first so that no
    // dup2 below can clobber a source it still needs.
    int src[4] = {p.in[0], p.out[1], p.err[1], p.status[1]};
    for (int& fd : src) {
        int moved = fcntl(fd, F_DUPFD_CLOEXEC, 16);
        if (moved < 0) _exit(127);
        fd = moved;
    }
    for (int target = 0; target < 4; target++) {
        if (dup2(src[target], target) < 0) _exit(127);
    }

    long maxfd = sysconf(_SC_OPEN_MAX);
    if (maxfd < 256) maxfd = 256;
    if (maxfd > 65536) maxfd = 65536;
    for (int fd = kCellStatusFd + 1; fd < maxfd; fd++) {
        (void)close(fd);
    }

    // isolate process group so the watchdog can kill the whole subtree
    (void)setpgid(0, 0);
    (void)umask(077);
    if (chdir("/") != 0) _exit(127);

#ifdef __linux__
    (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
    (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
    (void)prctl(PR_SET_DUMPABLE, 0, 0, 0, 0);
    // parent died before PDEATHSIG was armed
    if (getppid() != parent) _exit(127);
#else
    (void)parent;
#endif

    long cpu_sec = cpu_rlimit_seconds(lim.cpu_ms);
    set_rlimit(RLIMIT_CPU, (rlim_t)cpu_sec, (rlim_t)cpu_sec + 1);
    if (lim.memory_mb > 0) {
        rlim_t bytes = (rlim_t)lim.memory_mb * 1024ULL * 1024ULL;
        set_rlimit(RLIMIT_AS, bytes, bytes);
    }
    set_rlimit(RLIMIT_FSIZE, 0, 0);
    set_rlimit(RLIMIT_CORE, 0, 0);
    if (lim.rlimit_nofile > 0) {
        set_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile, (rlim_t)lim.rlimit_nofile);
    }
#ifdef RLIMIT_NPROC
    if (lim.rlimit_nproc > 0) {
        set_rlimit(RLIMIT_NPROC, (rlim_t)lim.rlimit_nproc, (rlim_t)lim.rlimit_nproc);
    }
#endif

    execve(argv[0], argv, envp);
    _exit(127);
}

int64_t timeval_ms(const struct timeval& tv) {
    return (int64_t)tv.tv_sec * 1000 + (int64_t)tv.tv_usec / 1000;
}

} // namespace

bool run_cell(const std::string& cell_bin,
              const std::string& request_doc,
              const ResourceLimits& lim,
              const CancelToken* cancel,
              RunRecord* rec) {
    if (!rec) return false;
    *rec = RunRecord{};

    if (cell_bin.empty()) {
        rec->error = "cell binary not configured";
        return false;
    }

    Pipes p;
    for (int* fds : {p.in, p.out, p.err, p.status}) {
        if (pipe2(fds, O_CLOEXEC) != 0) {
            rec->error = std::string("pipe failed: ") + std::strerror(errno);
            p.close_all();
            return false;
        }
    }

    // Everything the child needs is built before fork.
    std::vector<char*> argv = {const_cast<char*>(cell_bin.c_str()), nullptr};
    char* envp[] = {nullptr};
    const pid_t parent = getpid();

    auto start = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        rec->error = std::string("fork failed: ") + std::strerror(errno);
        p.close_all();
        return false;
    }
    if (pid == 0) {
        exec_child(p, parent, lim, argv.data(), envp);
    }

    // parent
    (void)setpgid(pid, pid);
    rec->spawned = true;
    close_fd(p.in[0]);
    close_fd(p.out[1]);
    close_fd(p.err[1]);
    close_fd(p.status[1]);

    int in_fd = p.in[1];
    int out_fd = p.out[0];
    int err_fd = p.err[0];
    int st_fd = p.status[0];
    set_nonblocking(in_fd);
    set_nonblocking(out_fd);
    set_nonblocking(err_fd);
    set_nonblocking(st_fd);

    BoundedCapture out(lim.stdout_max_bytes);
    BoundedCapture err(lim.stderr_max_bytes);
    BoundedCapture status(lim.status_max_bytes);
    LimitTracker tracker;
    size_t write_off = 0;
    if (request_doc.empty()) close_fd(in_fd);

    int wstatus = 0;
    struct rusage ru;
    std::memset(&ru, 0, sizeof(ru));
    bool reaped = false;
    bool killed = false;

    auto kill_group = [&]() {
        if (killed) return;
        killed = true;
        (void)kill(-pid, SIGKILL);
        (void)kill(pid, SIGKILL);
    };

    // Returns false when the stream's capture overflowed.
    auto drain = [&](int& fd, BoundedCapture& cap) -> bool {
        if (fd < 0) return true;
        char buf[4096];
        while (true) {
            ssize_t n = read(fd, buf, sizeof(buf));
            if (n > 0) {
                if (!cap.append(buf, (size_t)n)) return false;
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
            close_fd(fd); // EOF or error
            return true;
        }
    };

    auto elapsed_ms = [&]() {
        return (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
    };

    while (!reaped) {
        if (!killed) {
            if (cancel && cancel->is_cancelled()) {
                tracker.hit(LimitHit::CANCELLED);
                kill_group();
            } else if (lim.timeout_ms > 0 && elapsed_ms() >= lim.timeout_ms) {
                tracker.hit(LimitHit::WALL_CLOCK);
                kill_group();
            }
        }

        struct pollfd fds[4];
        nfds_t nfds = 0;
        if (in_fd >= 0) fds[nfds++] = {in_fd, POLLOUT, 0};
        for (int fd : {out_fd, err_fd, st_fd}) {
            if (fd >= 0) fds[nfds++] = {fd, POLLIN, 0};
        }
        int slice = lim.poll_slice_ms > 0 ? lim.poll_slice_ms : 10;
        if (!killed && lim.timeout_ms > 0) {
            int64_t remaining = lim.timeout_ms - elapsed_ms();
            slice = (int)std::max<int64_t>(1, std::min<int64_t>(slice, remaining));
        }
        int pr = poll(nfds ? fds : nullptr, nfds, slice);
        if (pr < 0 && errno != EINTR) {
            rec->error = std::string("poll failed: ") + std::strerror(errno);
            kill_group();
        }

        if (in_fd >= 0) {
            while (write_off < request_doc.size()) {
                ssize_t n = write(in_fd, request_doc.data() + write_off, request_doc.size() - write_off);
                if (n > 0) {
                    write_off += (size_t)n;
                    continue;
                }
                if (n < 0 && errno == EINTR) continue;
                if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                write_off = request_doc.size(); // EPIPE: child went away
                break;
            }
            if (write_off >= request_doc.size()) close_fd(in_fd);
        }

        if (!drain(out_fd, out) || !drain(err_fd, err)) {
            tracker.hit(LimitHit::OUTPUT);
            kill_group();
        }
        if (!drain(st_fd, status)) {
            rec->status_overflow = true;
            kill_group();
        }

        pid_t w = wait4(pid, &wstatus, WNOHANG, &ru);
        if (w == pid) reaped = true;
        else if (w < 0 && errno != EINTR) {
            rec->error = std::string("wait4 failed: ") + std::strerror(errno);
            kill_group();
            break;
        }
    }

    // the group may still hold a process if the cell leader exited first
    if (!killed) (void)kill(-pid, SIGKILL);
    if (!reaped) {
        while (wait4(pid, &wstatus, 0, &ru) < 0 && errno == EINTR) {}
        reaped = true;
    }
    rec->duration_ms = elapsed_ms();

    // collect whatever was written before exit
    if (!drain(out_fd, out) || !drain(err_fd, err)) tracker.hit(LimitHit::OUTPUT);
    if (!drain(st_fd, status)) rec->status_overflow = true;
    close_fd(in_fd);
    close_fd(out_fd);
    close_fd(err_fd);
    close_fd(st_fd);

    rec->exited = reaped;
    if (WIFEXITED(wstatus)) rec->exit_code = WEXITSTATUS(wstatus);
    else if (WIFSIGNALED(wstatus)) rec->term_signal = WTERMSIG(wstatus);

    rec->cpu_ms = timeval_ms(ru.ru_utime) + timeval_ms(ru.ru_stime);
    rec->max_rss_kb = (int64_t)ru.ru_maxrss;

    // a signalled run that outlived its deadline is a timeout even if RLIMIT_CPU fired first
    if (!killed && rec->term_signal != 0 && lim.timeout_ms > 0 && rec->duration_ms >= lim.timeout_ms) {
        tracker.hit(LimitHit::WALL_CLOCK);
    }
    // the kernel enforces RLIMIT_CPU with SIGXCPU, then SIGKILL at the hard limit
    if (!killed && (rec->term_signal == SIGXCPU ||
                    (rec->term_signal == SIGKILL && rec->cpu_ms >= cpu_rlimit_seconds(lim.cpu_ms) * 1000))) {
        tracker.hit(LimitHit::CPU_TIME);
    }

    rec->limit = tracker.first();
    rec->truncated = out.truncated() || err.truncated();
    rec->stdout_text = out.take();
    rec->stderr_text = err.take();
    rec->status_text = status.take();
    return true;
}

} // namespace cordon
