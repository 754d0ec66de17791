/**
 * @file transport_process.hpp
 * @brief ITransport over a child process's stdin/stdout (the cec-client adapter).
 *
 * @details
 * PURPOSE
 * -------
 * The CEC adapter is an external program that prints diagnostics on stdout
 * and takes commands on stdin. ProcessTransport starts it with fork/execvp,
 * wires both pipes, and exposes them through the ITransport contract.
 *
 * DESIGN CHOICES
 * --------------
 * - POSIX only: pipe(2), fork(2), execvp(3), poll(2), kill(2), waitpid(2).
 * - stdout of the child is read non-blocking; recv() waits with poll().
 * - stderr of the child is merged into stdout (libcec logs there too).
 * - end() sends SIGINT (the adapter's clean exit), waits briefly, then
 *   SIGKILL if it is still around.
 * - begin() sets SIGPIPE to ignored for the whole process, so writing to a
 *   dead child fails with EPIPE (send() returns Error) instead of killing us.
 *
 * LIMITATIONS
 * -----------
 * - One child per instance. Not thread-safe; keep it on the host loop thread.
 */
#ifndef CECBRIDGE_TRANSPORT_PROCESS_HPP
#define CECBRIDGE_TRANSPORT_PROCESS_HPP

#include <sys/types.h>
#include "cecbridge/transport/transport_base.hpp"

namespace cecbridge::transport {

class ProcessTransport : public ITransport {
public:
  ProcessTransport() = default;
  ~ProcessTransport() override;

  ProcessTransport(const ProcessTransport&) = delete;
  ProcessTransport& operator=(const ProcessTransport&) = delete;

  bool        begin(const Config& cfg) override;
  void        end() override;
  bool        is_open() const override { return pid_ > 0; }
  RxResult    recv(uint8_t* out, std::size_t cap, std::size_t& out_len) override;
  TxResult    send(const uint8_t* data, std::size_t len) override;
  const char* name() const override { return "process"; }

  pid_t pid() const { return pid_; }

  /// Exit status of the child after it was reaped, -1 before.
  int exit_status() const { return exit_status_; }

private:
  void close_pipes();
  bool reap(int wait_ms);

  pid_t pid_{-1};
  int   in_fd_{-1};     ///< write end → child stdin
  int   out_fd_{-1};    ///< read end ← child stdout/stderr
  int   poll_timeout_ms_{100};
  int   exit_status_{-1};
};

} // namespace cecbridge::transport

#endif // CECBRIDGE_TRANSPORT_PROCESS_HPP
