#include "process_runner.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

using Clock = std::chrono::steady_clock;

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// Drains what is readable; closes fd on EOF or hard error.
void drain(int& fd, std::string& sink) {
    char buf[4096];
    for (;;) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            sink.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        close_fd(fd);
        return;
    }
}

// Writes to a pipe whose reader may already be gone must not raise SIGPIPE in
// the host process, so the signal is blocked for the duration of a run and any
// instance raised by this thread is consumed before unblocking.
class SigpipeGuard {
public:
    SigpipeGuard() {
        sigemptyset(&set_);
        sigaddset(&set_, SIGPIPE);
        pthread_sigmask(SIG_BLOCK, &set_, &old_);
    }
    ~SigpipeGuard() {
        sigset_t pending;
        sigemptyset(&pending);
        if (sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE)) {
            timespec zero{0, 0};
            sigtimedwait(&set_, nullptr, &zero);
        }
        pthread_sigmask(SIG_SETMASK, &old_, nullptr);
    }
private:
    sigset_t set_;
    sigset_t old_;
};

} // namespace

ProcessResult run_process(const std::vector<std::string>& argv,
                          const std::string& stdin_data,
                          std::chrono::milliseconds timeout) {
    ProcessResult r;
    if (argv.empty()) {
        r.error = "empty command";
        return r;
    }

    int inpipe[2] = {-1, -1}, outpipe[2] = {-1, -1}, errpipe[2] = {-1, -1};
    if (pipe2(inpipe, O_CLOEXEC) == -1 || pipe2(outpipe, O_CLOEXEC) == -1 || pipe2(errpipe, O_CLOEXEC) == -1) {
        r.error = std::string("failed to create pipes: ") + std::strerror(errno);
        for (int* p : {inpipe, outpipe, errpipe}) { close_fd(p[0]); close_fd(p[1]); }
        return r;
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    SigpipeGuard sigpipe_guard;
    const auto t0 = Clock::now();
    const auto deadline = t0 + timeout;

    pid_t pid = fork();
    if (pid < 0) {
        r.error = std::string("fork failed: ") + std::strerror(errno);
        for (int* p : {inpipe, outpipe, errpipe}) { close_fd(p[0]); close_fd(p[1]); }
        return r;
    }

    if (pid == 0) {
        setpgid(0, 0);
        sigset_t none;
        sigemptyset(&none);
        pthread_sigmask(SIG_SETMASK, &none, nullptr);
        dup2(inpipe[0], STDIN_FILENO);
        dup2(outpipe[1], STDOUT_FILENO);
        dup2(errpipe[1], STDERR_FILENO);
        execvp(cargv[0], cargv.data());
        std::perror("execvp");
        _exit(127);
    }

    setpgid(pid, pid);
    r.started = true;
    close_fd(inpipe[0]);
    close_fd(outpipe[1]);
    close_fd(errpipe[1]);

    int in_fd = inpipe[1];
    int out_fd = outpipe[0];
    int err_fd = errpipe[0];
    set_nonblocking(in_fd);
    set_nonblocking(out_fd);
    set_nonblocking(err_fd);

    size_t written = 0;
    if (stdin_data.empty()) close_fd(in_fd);

    while (out_fd >= 0 || err_fd >= 0) {
        auto now = Clock::now();
        if (now >= deadline) {
            r.timed_out = true;
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        int wait_ms = static_cast<int>(std::min<long long>(remaining, 100));

        pollfd fds[3];
        nfds_t nfds = 0;
        int in_idx = -1, out_idx = -1, err_idx = -1;
        if (in_fd >= 0) { in_idx = static_cast<int>(nfds); fds[nfds++] = {in_fd, POLLOUT, 0}; }
        if (out_fd >= 0) { out_idx = static_cast<int>(nfds); fds[nfds++] = {out_fd, POLLIN, 0}; }
        if (err_fd >= 0) { err_idx = static_cast<int>(nfds); fds[nfds++] = {err_fd, POLLIN, 0}; }

        int rc = poll(fds, nfds, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            r.error = std::string("poll failed: ") + std::strerror(errno);
            break;
        }
        if (rc == 0) continue;

        if (in_idx >= 0 && fds[in_idx].revents) {
            if (fds[in_idx].revents & (POLLERR | POLLHUP)) {
                close_fd(in_fd);
            } else {
                ssize_t n = write(in_fd, stdin_data.data() + written, stdin_data.size() - written);
                if (n > 0) {
                    written += static_cast<size_t>(n);
                    if (written == stdin_data.size()) close_fd(in_fd);
                } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    // EPIPE: the child stopped reading; what it produced still counts
                    close_fd(in_fd);
                }
            }
        }
        if (out_idx >= 0 && fds[out_idx].revents) drain(out_fd, r.out);
        if (err_idx >= 0 && fds[err_idx].revents) drain(err_fd, r.err);
    }
    close_fd(in_fd);

    int status = 0;
    bool reaped = false;
    if (!r.timed_out && r.error.empty()) {
        // Streams are closed; give the child until the deadline to be reaped.
        for (;;) {
            pid_t w = waitpid(pid, &status, WNOHANG);
            if (w == pid) {
                reaped = true;
                break;
            }
            if (w < 0 && errno != EINTR) {
                r.error = std::string("waitpid failed: ") + std::strerror(errno);
                break;
            }
            if (Clock::now() >= deadline) {
                r.timed_out = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
    }
    if (r.timed_out || !r.error.empty()) {
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        reaped = true;
    }
    close_fd(out_fd);
    close_fd(err_fd);

    r.ms = std::chrono::duration<double, std::milli>(Clock::now() - t0).count();

    if (reaped && !r.timed_out && r.error.empty()) {
        if (WIFEXITED(status)) {
            r.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            r.term_signal = WTERMSIG(status);
        }
    }
    return r;
}
