/*
 * POSIX child process implementation - jdkrun
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#ifndef _WIN32
#include <jdkrun/exec/process.hpp>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace jdkrun {

namespace {

constexpr size_t kChunkSize = 4096;

bool make_pipe(int fds[2]) {
#ifdef __linux__
    return ::pipe2(fds, O_CLOEXEC) == 0;
#else
    if (::pipe(fds) != 0) return false;
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
#endif
}

void close_fd(int& fd) {
    if (fd >= 0) { ::close(fd); fd = -1; }
}

std::vector<char*> make_argv(const std::vector<std::string>& argv) {
    std::vector<char*> cargv; cargv.reserve(argv.size()+1);
    for (auto &s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);
    return cargv;
}

// Reads both pipes until EOF on each, forwarding chunks in arrival order.
void drain_streams(int out_fd, int err_fd, const std::function<void(StreamKind, std::string)>& on_data) {
    struct pollfd fds[2];
    fds[0] = {out_fd, POLLIN, 0};
    fds[1] = {err_fd, POLLIN, 0};
    int open_count = (out_fd >= 0) + (err_fd >= 0);
    if (out_fd < 0) fds[0].fd = -1;
    if (err_fd < 0) fds[1].fd = -1;
    char buf[kChunkSize];
    while (open_count > 0) {
        int r = ::poll(fds, 2, -1);
        if (r < 0) {
            if (errno == EINTR) continue;
            perror("poll");
            break;
        }
        for (int i=0;i<2;++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) { fds[i].fd = -1; --open_count; continue; }
            if (on_data) on_data(i==0 ? StreamKind::Stdout : StreamKind::Stderr, std::string(buf, static_cast<size_t>(n)));
        }
    }
}

ExitStatus wait_child(pid_t pid) {
    ExitStatus es;
    int st = 0;
    pid_t r;
    while ((r = ::waitpid(pid, &st, 0)) < 0 && errno == EINTR) {}
    if (r < 0) { es.code = -1; return es; }
    if (WIFEXITED(st)) es.code = WEXITSTATUS(st);
    else if (WIFSIGNALED(st)) es.signal = WTERMSIG(st);
    return es;
}

// Child side after fork: wire the pipe ends, chdir, exec. Never returns.
// Only async-signal-safe calls here: other threads may hold stdio locks.
[[noreturn]] void exec_child(int in_fd, int out_fd, int err_fd, const std::string& cwd, std::vector<char*>& cargv) {
    auto fail = [&](const char* what) {
        const char* prog = cargv[0] ? cargv[0] : "";
        ssize_t w;
        w = ::write(STDERR_FILENO, what, std::strlen(what));
        w = ::write(STDERR_FILENO, prog, std::strlen(prog));
        w = ::write(STDERR_FILENO, "\n", 1);
        (void)w;
        _exit(127);
    };
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGPIPE, SIG_DFL);
    sigset_t none; sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr); // the console blocks SIGINT in worker threads
    if (in_fd >= 0) ::dup2(in_fd, STDIN_FILENO);
    if (out_fd >= 0) ::dup2(out_fd, STDOUT_FILENO);
    if (err_fd >= 0) ::dup2(err_fd, STDERR_FILENO);
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) fail("chdir failed for ");
    ::execvp(cargv[0], cargv.data());
    fail("execvp failed: ");
    _exit(127);
}

void set_nonblock(int fd) {
    int fl = ::fcntl(fd, F_GETFL);
    if (fl >= 0) ::fcntl(fd, F_SETFL, fl | O_NONBLOCK);
}

// Two threads per child: the reaper blocks in waitpid, the monitor polls the
// pipes (and stdin, while input is queued). The exit is reported as soon as
// the child is reaped, after reading what is already buffered in its pipes;
// descendants still holding the pipes do not delay it.
class PosixProcess : public ProcessHandle {
public:
    PosixProcess(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd, ProcessCallbacks cb)
        : m_pid(pid), m_stdin(stdin_fd), m_out(stdout_fd), m_err(stderr_fd), m_cb(std::move(cb)) {
        for (int fd : {m_stdin, m_out, m_err}) if (fd >= 0) set_nonblock(fd);
        if (make_pipe(m_wake)) { set_nonblock(m_wake[0]); set_nonblock(m_wake[1]); }
        else { m_wake[0] = m_wake[1] = -1; }
        m_reaper = std::thread([this]{
            ExitStatus es = wait_child(m_pid);
            { std::lock_guard<std::mutex> lk(m_mu); m_status = es; }
            m_reaped = true;
            wake();
        });
        m_monitor = std::thread([this]{ monitor_loop(); });
    }

    ~PosixProcess() override {
        close_input();
        if (m_monitor.joinable()) m_monitor.join();
        if (m_reaper.joinable()) m_reaper.join();
        close_fd(m_wake[0]); close_fd(m_wake[1]);
    }

    int pid() const override { return static_cast<int>(m_pid); }

    bool write_stdin(const std::string& text) override {
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (m_input_closed || m_input_closing) return false;
            m_pending_input += text;
        }
        wake();
        return true;
    }

    void close_input() override {
        { std::lock_guard<std::mutex> lk(m_mu); m_input_closing = true; }
        wake();
    }

    bool exited() const override { return m_reaped; }

private:
    void wake() {
        if (m_wake[1] < 0) return;
        char c = 1;
        ssize_t w = ::write(m_wake[1], &c, 1); // EAGAIN: a wakeup is already pending
        (void)w;
    }

    // false once the pipe reached EOF or failed.
    bool read_chunk(int fd, StreamKind kind) {
        char buf[kChunkSize];
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            if (m_cb.on_data) m_cb.on_data(kind, std::string(buf, static_cast<size_t>(n)));
            return true;
        }
        return n < 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK);
    }

    void drain_now(int& fd, StreamKind kind) {
        if (fd < 0) return;
        char buf[kChunkSize];
        while (true) {
            ssize_t n = ::read(fd, buf, sizeof(buf));
            if (n > 0) { if (m_cb.on_data) m_cb.on_data(kind, std::string(buf, static_cast<size_t>(n))); continue; }
            if (n < 0 && errno == EINTR) continue;
            break;
        }
        close_fd(fd);
    }

    // Caller holds m_mu.
    void flush_input() {
        while (!m_pending_input.empty() && m_stdin >= 0) {
            ssize_t n = ::write(m_stdin, m_pending_input.data(), m_pending_input.size());
            if (n > 0) { m_pending_input.erase(0, static_cast<size_t>(n)); continue; }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
            // EPIPE: the child closed its stdin
            m_pending_input.clear();
            close_fd(m_stdin);
            m_input_closed = true;
        }
    }

    void monitor_loop() {
        while (!m_reaped) {
            struct pollfd fds[4];
            fds[0] = {m_wake[0], POLLIN, 0};
            fds[1] = {m_out, POLLIN, 0};
            fds[2] = {m_err, POLLIN, 0};
            fds[3] = {-1, POLLOUT, 0};
            {
                std::lock_guard<std::mutex> lk(m_mu);
                if (m_stdin >= 0) {
                    if (!m_pending_input.empty()) fds[3].fd = m_stdin;
                    else if (m_input_closing) { close_fd(m_stdin); m_input_closed = true; }
                }
            }
            int r = ::poll(fds, 4, m_wake[0] >= 0 ? -1 : 50);
            if (r < 0) {
                if (errno == EINTR) continue;
                perror("poll");
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                continue;
            }
            if (fds[0].fd >= 0 && fds[0].revents) {
                char buf[64];
                while (::read(m_wake[0], buf, sizeof(buf)) > 0) {}
            }
            if (fds[1].fd >= 0 && fds[1].revents && !read_chunk(m_out, StreamKind::Stdout)) close_fd(m_out);
            if (fds[2].fd >= 0 && fds[2].revents && !read_chunk(m_err, StreamKind::Stderr)) close_fd(m_err);
            if (fds[3].fd >= 0 && fds[3].revents) {
                std::lock_guard<std::mutex> lk(m_mu);
                flush_input();
            }
        }
        // everything the child wrote is already in the pipe buffers
        drain_now(m_out, StreamKind::Stdout);
        drain_now(m_err, StreamKind::Stderr);
        ExitStatus es;
        {
            std::lock_guard<std::mutex> lk(m_mu);
            close_fd(m_stdin);
            m_pending_input.clear();
            m_input_closed = true;
            es = m_status;
        }
        if (m_cb.on_exit) m_cb.on_exit(es);
    }

    pid_t m_pid;
    int m_stdin;
    int m_out;
    int m_err;
    int m_wake[2] = {-1, -1};
    ProcessCallbacks m_cb;

    std::mutex m_mu;
    std::string m_pending_input;
    bool m_input_closing = false;
    bool m_input_closed = false;
    ExitStatus m_status;
    std::atomic<bool> m_reaped{false};

    std::thread m_reaper;
    std::thread m_monitor;
};

// Stand-in handle for a launch that never produced a process.
class FailedProcess : public ProcessHandle {
public:
    int pid() const override { return -1; }
    bool write_stdin(const std::string&) override { return false; }
    void close_input() override {}
    bool exited() const override { return true; }
};

} // namespace

PosixProcessLauncher::PosixProcessLauncher() {
    // Writes to a dead child's stdin must fail with EPIPE, not kill us.
    std::signal(SIGPIPE, SIG_IGN);
}

std::unique_ptr<ProcessHandle> PosixProcessLauncher::launch(const LaunchSpec& spec, ProcessCallbacks cb) {
    std::vector<std::string> argv; argv.reserve(spec.args.size()+1);
    argv.push_back(spec.program);
    for (auto &a : spec.args) argv.push_back(a);
    auto cargv = make_argv(argv);

    int in[2] = {-1,-1}, out[2] = {-1,-1}, err[2] = {-1,-1};
    auto fail = [&](const char* what) -> std::unique_ptr<ProcessHandle> {
        std::string msg = std::string(what) + ": " + std::strerror(errno) + "\n";
        for (int* p : {in, out, err}) { close_fd(p[0]); close_fd(p[1]); }
        if (cb.on_data) cb.on_data(StreamKind::Stderr, msg);
        if (cb.on_exit) cb.on_exit(ExitStatus{127, std::nullopt});
        return std::make_unique<FailedProcess>();
    };
    if (!make_pipe(in) || !make_pipe(out) || !make_pipe(err)) return fail("pipe");

    pid_t pid = ::fork();
    if (pid < 0) return fail("fork");
    if (pid == 0) {
        ::setpgid(0,0);
        exec_child(in[0], out[1], err[1], spec.cwd, cargv);
    }
    ::setpgid(pid, pid);
    close_fd(in[0]); close_fd(out[1]); close_fd(err[1]);
    return std::make_unique<PosixProcess>(pid, in[1], out[0], err[0], std::move(cb));
}

CapturedRun run_captured(const std::vector<std::string>& argv, const std::string& cwd) {
    CapturedRun res;
    if (argv.empty()) { res.err = "empty command"; return res; }
    auto cargv = make_argv(argv);
    int out[2] = {-1,-1}, err[2] = {-1,-1};
    if (!make_pipe(out) || !make_pipe(err)) {
        res.err = std::string("pipe: ") + std::strerror(errno);
        close_fd(out[0]); close_fd(out[1]); close_fd(err[0]); close_fd(err[1]);
        return res;
    }
    pid_t pid = ::fork();
    if (pid < 0) {
        res.err = std::string("fork: ") + std::strerror(errno);
        close_fd(out[0]); close_fd(out[1]); close_fd(err[0]); close_fd(err[1]);
        return res;
    }
    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDONLY);
        exec_child(devnull, out[1], err[1], cwd, cargv);
    }
    close_fd(out[1]); close_fd(err[1]);
    drain_streams(out[0], err[0], [&](StreamKind k, std::string data) {
        (k == StreamKind::Stdout ? res.out : res.err) += data;
    });
    close_fd(out[0]); close_fd(err[0]);
    ExitStatus es = wait_child(pid);
    if (es.code) res.exit_code = *es.code;
    else if (es.signal) res.exit_code = 128 + *es.signal;
    return res;
}

} // namespace jdkrun
#endif // _WIN32
