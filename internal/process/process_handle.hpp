#pragma once

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/command/command_builder.hpp"

namespace ferry::process {

/*
  Terminal state of one engine process.
*/
struct ExitResult {
  int         exit_code{0};   // -1 when the process ended on a signal
  int         term_signal{0};
  std::string stderr_text;    // tail of stderr_capture_bytes, or all of it when that is 0
  bool        cancelled{false};

  bool ok() const {
    return exit_code == 0 && term_signal == 0 && !cancelled;
  }
};

struct SpawnOptions {
  bool                      pipe_stdin{false};
  bool                      echo_stderr{false};
  std::size_t               stderr_capture_bytes{64 * 1024}; // 0 keeps everything
  std::chrono::milliseconds terminate_grace{2000};
};

/*
  Owns one child process: its pid, its three pipes, the stderr drainer
  and input writer threads, and the temp artifact its argv refers to.

  Every exit path (Wait, Terminate, destruction) goes through one
  cleanup routine that joins the threads, closes the pipes, reaps the
  child and removes the temp artifact.

  stdout is read by exactly one consumer on the caller's thread
  (a decoder or a line reader). stdin, when piped, belongs to the input
  writer thread.
*/
class ProcessHandle {
 public:
  // Writes to `fd` until done or `stop` is set. Exceptions are kept and reported by Wait().
  using InputWriter = std::function<void(int fd, const std::atomic<bool>& stop)>;

  // Throws ProcessError (127) when the engine cannot be executed, ResourceError when pipes cannot be created.
  static std::unique_ptr<ProcessHandle> Spawn(command::Invocation invocation, const SpawnOptions& options);

  ~ProcessHandle();

  ProcessHandle(const ProcessHandle&)            = delete;
  ProcessHandle& operator=(const ProcessHandle&) = delete;

  pid_t pid() const {
    return pid_;
  }

  int stdout_fd() const {
    return stdout_fd_;
  }

  const std::vector<std::string>& argv() const {
    return argv_;
  }

  // Empty when no temp artifact was written.
  std::string temp_artifact_path() const;

  // Starts the writer thread. The write side of stdin is closed exactly once when it returns.
  void StartInputWriter(InputWriter writer);

  // Called by the stdout consumer when it gives up on malformed output.
  void RecordDecodeError(std::exception_ptr error);

  /*
    Drains any unread stdout, waits for exit and cleans up.
    Throws, by priority: ProcessError, EncodeError, DecodeError, ResourceError.
  */
  ExitResult Wait();

  // SIGTERM, then SIGKILL after the grace period. Never throws.
  ExitResult Terminate();

  bool finished() const {
    return finished_;
  }

  // Valid once finished().
  const ExitResult& result() const {
    return result_;
  }

  std::string StderrTail() const;

 private:
  ProcessHandle(command::Invocation invocation, const SpawnOptions& options);

  void DrainStderr();
  void DiscardStdout();
  void Reap(bool terminate);
  void Cleanup(bool terminate);
  void ThrowIfFailed() const;

  std::vector<std::string>               argv_;
  std::unique_ptr<command::TempArtifact> temp_artifact_;
  SpawnOptions                           options_;

  pid_t pid_{-1};
  int   stdin_fd_{-1};
  int   stdout_fd_{-1};
  int   stderr_fd_{-1};

  std::thread       stderr_thread_;
  std::thread       input_thread_;
  std::atomic<bool> stop_input_{false};

  mutable std::mutex stderr_mu_;
  std::string        stderr_tail_;

  mutable std::mutex error_mu_;
  std::exception_ptr encode_error_;
  std::exception_ptr decode_error_;
  std::exception_ptr resource_error_;
  std::atomic<bool>  input_aborted_{false};

  bool       finished_{false};
  ExitResult result_;
};

} // namespace ferry::process
