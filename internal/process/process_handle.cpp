#include "process_handle.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ferry::process {

using ferry::observability::IntField;
using ferry::observability::StringField;

namespace {

std::once_flag g_sigpipe_once;

// Broken pipes are reported through write() errors instead of killing the bridge.
void IgnoreSigpipe() {
  std::call_once(g_sigpipe_once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

struct Pipe {
  int read_fd{-1};
  int write_fd{-1};
};

void CloseFd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

void ClosePipe(Pipe& pipe) {
  CloseFd(pipe.read_fd);
  CloseFd(pipe.write_fd);
}

Pipe MakePipe() {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    throw ferry::util::ResourceError(std::string("cannot create pipe: ") + std::strerror(errno));
  }
  return Pipe{fds[0], fds[1]};
}

// PATH lookup against the child's environment, done before fork.
std::string ResolveExecutable(const std::string& binary, const util::EnvMap& env) {
  if (binary.find('/') != std::string::npos) {
    return binary;
  }
  const auto search = util::GetOr(env, "PATH", "/usr/local/bin:/usr/bin:/bin");

  std::size_t start = 0;
  while (start <= search.size()) {
    auto end = search.find(':', start);
    if (end == std::string::npos) end = search.size();

    const auto dir       = search.substr(start, end - start);
    const auto candidate = (dir.empty() ? std::string(".") : dir) + "/" + binary;
    if (::access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
    start = end + 1;
  }
  return binary;
}

bool HasExited(pid_t pid) {
  siginfo_t info{};
  info.si_pid = 0;
  if (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
    return errno == ECHILD;
  }
  return info.si_pid == pid;
}

void AppendTail(std::string* tail, const char* data, std::size_t size, std::size_t limit) {
  tail->append(data, size);
  if (limit > 0 && tail->size() > limit) {
    tail->erase(0, tail->size() - limit);
  }
}

} // namespace

std::unique_ptr<ProcessHandle> ProcessHandle::Spawn(command::Invocation invocation, const SpawnOptions& options) {
  IgnoreSigpipe();
  return std::unique_ptr<ProcessHandle>(new ProcessHandle(std::move(invocation), options));
}

ProcessHandle::ProcessHandle(command::Invocation invocation, const SpawnOptions& options)
    : argv_(std::move(invocation.argv)), temp_artifact_(std::move(invocation.temp_artifact)), options_(options) {
  if (argv_.empty()) {
    throw ferry::util::ConfigurationError("empty command line");
  }

  // Everything the child needs is prepared here; after fork only async-signal-safe calls remain.
  const auto executable  = ResolveExecutable(argv_.front(), invocation.env);
  const auto env_strings = util::ToEnvStrings(invocation.env);

  std::vector<char*> c_argv;
  c_argv.reserve(argv_.size() + 1);
  for (auto& arg : argv_) c_argv.push_back(const_cast<char*>(arg.c_str()));
  c_argv.push_back(nullptr);

  std::vector<char*> c_env;
  c_env.reserve(env_strings.size() + 1);
  for (const auto& entry : env_strings) c_env.push_back(const_cast<char*>(entry.c_str()));
  c_env.push_back(nullptr);

  const char* working_dir = invocation.working_dir.empty() ? nullptr : invocation.working_dir.c_str();

  Pipe in, out, err, status;
  try {
    if (options_.pipe_stdin) in = MakePipe();
    out    = MakePipe();
    err    = MakePipe();
    status = MakePipe();
  } catch (const ferry::util::ResourceError&) {
    ClosePipe(in);
    ClosePipe(out);
    ClosePipe(err);
    ClosePipe(status);
    throw;
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int error = errno;
    ClosePipe(in);
    ClosePipe(out);
    ClosePipe(err);
    ClosePipe(status);
    throw ferry::util::ResourceError(std::string("fork failed: ") + std::strerror(error));
  }

  if (pid == 0) {
    if (in.read_fd >= 0) {
      ::dup2(in.read_fd, STDIN_FILENO);
    } else {
      const int devnull = ::open("/dev/null", O_RDONLY);
      if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    }
    ::dup2(out.write_fd, STDOUT_FILENO);
    ::dup2(err.write_fd, STDERR_FILENO);
    ::signal(SIGPIPE, SIG_DFL);

    int error = 0;
    if (working_dir && ::chdir(working_dir) != 0) {
      error = errno;
    } else {
      ::execve(executable.c_str(), c_argv.data(), c_env.data());
      error = errno;
    }
    const ssize_t reported = ::write(status.write_fd, &error, sizeof(error));
    ::_exit(reported == sizeof(error) ? 127 : 126);
  }

  pid_ = pid;
  CloseFd(in.read_fd);
  CloseFd(out.write_fd);
  CloseFd(err.write_fd);
  CloseFd(status.write_fd);

  // The status pipe closes on a successful exec and carries errno otherwise.
  int     child_errno = 0;
  ssize_t n           = 0;
  do {
    n = ::read(status.read_fd, &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  CloseFd(status.read_fd);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int wait_status = 0;
    while (::waitpid(pid_, &wait_status, 0) < 0 && errno == EINTR) {
    }
    ClosePipe(in);
    ClosePipe(out);
    ClosePipe(err);
    finished_ = true;
    throw ferry::util::ProcessError(127, "cannot execute " + argv_.front() +
                                             (working_dir ? " in " + invocation.working_dir : std::string()) + ": " +
                                             std::strerror(child_errno));
  }

  stdin_fd_  = in.write_fd;
  stdout_fd_ = out.read_fd;
  stderr_fd_ = err.read_fd;

  stderr_thread_ = std::thread([this] { DrainStderr(); });

  FERRY_LOG_DEBUG("engine started",
                  {IntField("pid", pid_), StringField("verb", argv_.size() > 1 ? argv_[1] : std::string())});
}

ProcessHandle::~ProcessHandle() {
  if (!finished_) {
    Cleanup(true);
  }
}

std::string ProcessHandle::temp_artifact_path() const {
  return temp_artifact_ ? temp_artifact_->path().string() : std::string();
}

void ProcessHandle::StartInputWriter(InputWriter writer) {
  if (stdin_fd_ < 0) {
    throw ferry::util::ConfigurationError("process was started without an input pipe");
  }
  if (input_thread_.joinable()) {
    throw std::logic_error("input writer already started");
  }

  input_thread_ = std::thread([this, writer = std::move(writer)] {
    try {
      writer(stdin_fd_, stop_input_);
    } catch (const std::exception& e) {
      {
        std::lock_guard<std::mutex> lock(error_mu_);
        if (ferry::util::ClassifyError(e) == ferry::util::ErrorKind::kResource) {
          resource_error_ = std::current_exception();
        } else {
          encode_error_ = std::current_exception();
        }
      }
      // The engine must not commit a partial input.
      if (!stop_input_.exchange(true)) {
        input_aborted_ = true;
        ::kill(pid_, SIGTERM);
      }
      FERRY_LOG_ERROR("input stream aborted", {StringField("error", e.what())});
    }
    CloseFd(stdin_fd_);
  });
}

void ProcessHandle::RecordDecodeError(std::exception_ptr error) {
  std::lock_guard<std::mutex> lock(error_mu_);
  if (!decode_error_) decode_error_ = std::move(error);
}

void ProcessHandle::DrainStderr() {
  char        buffer[4096];
  std::string line;

  for (;;) {
    const ssize_t n = ::read(stderr_fd_, buffer, sizeof(buffer));
    if (n < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (n == 0) break;

    {
      std::lock_guard<std::mutex> lock(stderr_mu_);
      AppendTail(&stderr_tail_, buffer, static_cast<std::size_t>(n), options_.stderr_capture_bytes);
    }

    if (!options_.echo_stderr) continue;
    for (ssize_t i = 0; i < n; ++i) {
      if (buffer[i] == '\n') {
        FERRY_LOG_INFO(line, {StringField("stream", "stderr")});
        line.clear();
      } else {
        line.push_back(buffer[i]);
      }
    }
  }

  if (options_.echo_stderr && !line.empty()) {
    FERRY_LOG_INFO(line, {StringField("stream", "stderr")});
  }
}

void ProcessHandle::DiscardStdout() {
  if (stdout_fd_ < 0) return;
  char buffer[8192];
  for (;;) {
    const ssize_t n = ::read(stdout_fd_, buffer, sizeof(buffer));
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break;
  }
}

void ProcessHandle::Reap(bool terminate) {
  if (terminate && !HasExited(pid_)) {
    ::kill(pid_, SIGTERM);

    const auto deadline = std::chrono::steady_clock::now() + options_.terminate_grace;
    bool       exited   = HasExited(pid_);
    while (!exited && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      exited = HasExited(pid_);
    }
    if (!exited) {
      FERRY_LOG_WARN("engine ignored SIGTERM, killing", {IntField("pid", pid_)});
      ::kill(pid_, SIGKILL);
    }
  }

  // Wait for exit but leave the zombie in place until the threads are joined,
  // so the pid cannot be reused while the input writer may still signal it.
  siginfo_t info{};
  while (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) != 0 && errno == EINTR) {
  }
}

void ProcessHandle::Cleanup(bool terminate) {
  if (finished_) return;
  finished_ = true;

  if (!input_thread_.joinable()) {
    CloseFd(stdin_fd_);
  }
  if (!terminate) {
    DiscardStdout();
  }
  if (terminate) {
    stop_input_ = true;
  }

  Reap(terminate);

  stop_input_ = true;
  if (input_thread_.joinable()) input_thread_.join();
  CloseFd(stdin_fd_);
  CloseFd(stdout_fd_);
  if (stderr_thread_.joinable()) stderr_thread_.join();
  CloseFd(stderr_fd_);

  int status = 0;
  while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
  }
  if (WIFEXITED(status)) {
    result_.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result_.exit_code   = -1;
    result_.term_signal = WTERMSIG(status);
  }
  result_.cancelled   = terminate || input_aborted_;
  result_.stderr_text = StderrTail();

  if (temp_artifact_) {
    try {
      temp_artifact_->Remove();
    } catch (const ferry::util::ResourceError&) {
      std::lock_guard<std::mutex> lock(error_mu_);
      resource_error_ = std::current_exception();
    }
  }

  FERRY_LOG_DEBUG("engine exited", {IntField("pid", pid_), IntField("exit_code", result_.exit_code),
                                    IntField("signal", result_.term_signal),
                                    ferry::observability::BoolField("cancelled", result_.cancelled)});
}

void ProcessHandle::ThrowIfFailed() const {
  if (!result_.cancelled && (result_.exit_code != 0 || result_.term_signal != 0)) {
    const int code = result_.term_signal != 0 ? 128 + result_.term_signal : result_.exit_code;
    throw ferry::util::ProcessError(code, result_.stderr_text);
  }

  std::lock_guard<std::mutex> lock(error_mu_);
  if (encode_error_) std::rethrow_exception(encode_error_);
  if (decode_error_) std::rethrow_exception(decode_error_);
  if (resource_error_) std::rethrow_exception(resource_error_);
}

ExitResult ProcessHandle::Wait() {
  Cleanup(false);
  ThrowIfFailed();
  return result_;
}

ExitResult ProcessHandle::Terminate() {
  Cleanup(true);
  return result_;
}

std::string ProcessHandle::StderrTail() const {
  std::lock_guard<std::mutex> lock(stderr_mu_);
  return stderr_tail_;
}

} // namespace ferry::process
