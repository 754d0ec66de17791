// ============================================================================
// transport_process.cpp - adapter child process over stdin/stdout pipes
// For API/overview see transport/transport_process.hpp. Usage: cli/main.cpp.
// ============================================================================

#include "cecbridge/transport/transport_process.hpp"
#include "cecbridge/log.hpp"

#include <fcntl.h>         // fcntl, O_NONBLOCK, FD_CLOEXEC
#include <unistd.h>        // pipe, fork, execvp, read, write, close, dup2
#include <poll.h>          // poll(2) for recv timeout
#include <signal.h>        // kill, SIGINT, SIGKILL, SIGPIPE
#include <sys/wait.h>      // waitpid
#include <cerrno>
#include <cstring>         // strerror

namespace cecbridge::transport {

// ---------------------------------------------------------------------------
// helpers
// ---------------------------------------------------------------------------
static bool set_cloexec(int fd) {
    int flags = ::fcntl(fd, F_GETFD);
    return flags >= 0 && ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == 0;
}

static bool set_nonblock(int fd) {
    int flags = ::fcntl(fd, F_GETFL);
    return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

static void close_fd(int& fd) {
    if (fd >= 0) ::close(fd);
    fd = -1;
}

static void close_pair(int (&p)[2]) {
    close_fd(p[0]);
    close_fd(p[1]);
}

ProcessTransport::~ProcessTransport() {
    end();
}

// ---------------------------------------------------------------------------
// begin()
// -------
// Spawn cfg.program with cfg.args.
// - child stdin  ← to_child pipe
// - child stdout + stderr → from_child pipe (one text stream, as the adapter
//   interleaves its diagnostics)
// - a third CLOEXEC pipe reports an execvp() failure back as errno; EOF on
//   it means the exec went through.
//
// Returns: true once the child is running, false otherwise (nothing left open).
// ---------------------------------------------------------------------------
bool ProcessTransport::begin(const Config& cfg) {
    if (is_open()) end();

    int to_child[2]   = {-1, -1};
    int from_child[2] = {-1, -1};
    int exec_err[2]   = {-1, -1};
    if (::pipe(to_child) != 0 || ::pipe(from_child) != 0 || ::pipe(exec_err) != 0) {
        CECBRIDGE_ERROR("transport", "pipe: " << std::strerror(errno));
        close_pair(to_child); close_pair(from_child); close_pair(exec_err);
        return false;
    }
    if (!set_cloexec(to_child[1]) || !set_cloexec(from_child[0]) ||
        !set_cloexec(exec_err[0]) || !set_cloexec(exec_err[1])) {
        CECBRIDGE_ERROR("transport", "fcntl(FD_CLOEXEC): " << std::strerror(errno));
        close_pair(to_child); close_pair(from_child); close_pair(exec_err);
        return false;
    }

    // argv must be built before fork(); the child only calls async-signal-safe functions
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(cfg.program.c_str()));
    for (const auto& a : cfg.args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    ::signal(SIGPIPE, SIG_IGN);        // a dead child must turn writes into EPIPE, not kill us

    pid_t pid = ::fork();
    if (pid < 0) {
        CECBRIDGE_ERROR("transport", "fork: " << std::strerror(errno));
        close_pair(to_child); close_pair(from_child); close_pair(exec_err);
        return false;
    }

    if (pid == 0) {                    // child
        ::dup2(to_child[0], STDIN_FILENO);
        ::dup2(from_child[1], STDOUT_FILENO);
        ::dup2(from_child[1], STDERR_FILENO);
        ::close(to_child[0]);
        ::close(from_child[1]);
        ::execvp(argv[0], argv.data());
        int e = errno;
        ssize_t w = ::write(exec_err[1], &e, sizeof(e));
        (void)w;                       // nowhere left to report to
        ::_exit(127);
    }

    // parent
    close_fd(to_child[0]);
    close_fd(from_child[1]);
    close_fd(exec_err[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_err[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_err[0]);

    pid_     = pid;
    in_fd_   = to_child[1];
    out_fd_  = from_child[0];
    poll_timeout_ms_ = cfg.poll_timeout_ms;
    exit_status_ = -1;

    if (n > 0) {                       // exec failed in the child
        CECBRIDGE_ERROR("transport", "exec " << cfg.program << ": " << std::strerror(child_errno));
        close_pipes();
        reap(-1);
        pid_ = -1;
        return false;
    }

    if (!set_nonblock(out_fd_)) {
        CECBRIDGE_WARN("transport", "fcntl(O_NONBLOCK): " << std::strerror(errno));   // poll() still gates reads
    }
    CECBRIDGE_INFO("transport", "spawned " << cfg.program << " pid=" << pid_);
    return true;
}

// ---------------------------------------------------------------------------
// end()
// -----
// Close the adapter's stdin, ask it to quit (SIGINT), give it 500 ms, then
// SIGKILL. Safe to call more than once.
// ---------------------------------------------------------------------------
void ProcessTransport::end() {
    if (pid_ <= 0) {
        close_pipes();
        return;
    }
    close_fd(in_fd_);
    if (exit_status_ < 0) {
        ::kill(pid_, SIGINT);
        if (!reap(500)) {
            CECBRIDGE_WARN("transport", "pid=" << pid_ << " ignored SIGINT, killing");
            ::kill(pid_, SIGKILL);
            reap(-1);
        }
    }
    close_pipes();
    CECBRIDGE_DEBUG("transport", "pid=" << pid_ << " exit_status=" << exit_status_);
    pid_ = -1;
}

void ProcessTransport::close_pipes() {
    close_fd(in_fd_);
    close_fd(out_fd_);
}

// ---------------------------------------------------------------------------
// reap()
// ------
// waitpid() the child. wait_ms < 0 blocks; otherwise polls every 10 ms.
// Returns: true once the exit status is known.
// ---------------------------------------------------------------------------
bool ProcessTransport::reap(int wait_ms) {
    if (pid_ <= 0) return false;
    if (exit_status_ >= 0) return true;

    int status = 0;
    for (int waited = 0;; waited += 10) {
        pid_t r = ::waitpid(pid_, &status, wait_ms < 0 ? 0 : WNOHANG);
        if (r == pid_) break;
        if (r < 0 && errno == EINTR) continue;
        if (r < 0) return false;                  // not our child any more
        if (waited >= wait_ms) return false;      // still running
        ::usleep(10 * 1000);
    }

    if (WIFEXITED(status))        exit_status_ = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) exit_status_ = 128 + WTERMSIG(status);
    else                          exit_status_ = 0;
    return true;
}

// ---------------------------------------------------------------------------
// recv()
// ------
// Wait up to poll_timeout_ms for adapter output and read what is there.
// Returns: Ok (out_len > 0), None (timeout / EINTR), Closed (EOF), Error.
// ---------------------------------------------------------------------------
RxResult ProcessTransport::recv(uint8_t* out, std::size_t cap, std::size_t& out_len) {
    out_len = 0;
    if (out_fd_ < 0) return RxResult::Closed;
    if (!out || cap == 0) return RxResult::Error;

    pollfd pfd{out_fd_, POLLIN, 0};
    int pr = ::poll(&pfd, 1, poll_timeout_ms_);
    if (pr == 0) return RxResult::None;
    if (pr < 0)  return errno == EINTR ? RxResult::None : RxResult::Error;

    ssize_t n = ::read(out_fd_, out, cap);
    if (n > 0) {
        out_len = static_cast<std::size_t>(n);
        return RxResult::Ok;
    }
    if (n == 0) {                                 // adapter closed its stdout
        close_fd(out_fd_);
        reap(0);
        return RxResult::Closed;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return RxResult::None;
    CECBRIDGE_ERROR("transport", "read: " << std::strerror(errno));
    return RxResult::Error;
}

// ---------------------------------------------------------------------------
// send()
// ------
// Write all of data to the adapter's stdin.
// Returns: Ok, or Error if the pipe is gone (EPIPE) or another write error.
// ---------------------------------------------------------------------------
TxResult ProcessTransport::send(const uint8_t* data, std::size_t len) {
    if (in_fd_ < 0) return TxResult::Error;

    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::write(in_fd_, data + off, len - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            CECBRIDGE_WARN("transport", "write: " << std::strerror(errno));
            return TxResult::Error;
        }
        off += static_cast<std::size_t>(n);
    }
    return TxResult::Ok;
}

} // namespace cecbridge::transport
