/**
 * @file process.cpp
 * @brief Process supervision implementation
 *
 * @details fork/exec with three pipes per child:
 *
 *          - stdout and stderr, read non-blocking by await_exit()
 *
 *          - a close-on-exec status pipe: it closes silently when exec
 *            succeeds, or carries the child's errno when exec fails
 *
 * @note Linux-specific (pipe2, process groups).
 */

#include "media_convert/process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <thread>
#include <vector>

#include <fmt/core.h>

#include "media_convert/errors.hpp"
#include "media_convert/logging.hpp"

namespace media_convert {

namespace {

/// Read size per syscall
constexpr size_t READ_CHUNK_SIZE = 64 * 1024;

/// Upper bound on how long await_exit() sleeps between checks
constexpr int POLL_INTERVAL_MS = 50;

/// Bytes read per stream before the reap, cancel and silence checks run
/// again; a child that writes faster than the sink consumes cannot starve
/// them
constexpr size_t DRAIN_BUDGET = 256 * 1024;

std::string errno_message(int err) { return std::strerror(err); }

/// Blocking waitpid that survives EINTR
void wait_for_child(pid_t pid) {
  pid_t r;
  do {
    r = ::waitpid(pid, nullptr, 0);
  } while (r == -1 && errno == EINTR);
}

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

struct Pipe {
  int read_end = -1;
  int write_end = -1;

  ~Pipe() {
    close_fd(read_end);
    close_fd(write_end);
  }

  void open() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) == -1)
      throw SpawnError(fmt::format("pipe failed: {}", errno_message(errno)));
    read_end = fds[0];
    write_end = fds[1];
  }
};

/// Child side after fork: only async-signal-safe calls until exec
[[noreturn]] void exec_child(const Pipe &out, const Pipe &err,
                             const Pipe &status, const char *working_dir,
                             const std::vector<char *> &argv) {
  auto fail = [&status](int code) {
    ssize_t ignored = ::write(status.write_end, &code, sizeof(code));
    (void)ignored;
    ::_exit(127);
  };

  ::setpgid(0, 0);

  /// Restore default dispositions the parent may have changed
  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = SIG_DFL;
  ::sigaction(SIGINT, &sa, nullptr);
  ::sigaction(SIGTERM, &sa, nullptr);
  ::sigaction(SIGPIPE, &sa, nullptr);
  sigset_t empty;
  sigemptyset(&empty);
  ::sigprocmask(SIG_SETMASK, &empty, nullptr);

  /// Never close stdin; point it at /dev/null so the encoder cannot block
  int null_fd = ::open("/dev/null", O_RDONLY);
  if (null_fd == -1 || ::dup2(null_fd, STDIN_FILENO) == -1)
    fail(errno);
  if (::dup2(out.write_end, STDOUT_FILENO) == -1 ||
      ::dup2(err.write_end, STDERR_FILENO) == -1)
    fail(errno);

  if (working_dir && ::chdir(working_dir) == -1)
    fail(errno);

  ::execvp(argv[0], argv.data());
  fail(errno);
  ::_exit(127);
}

} // anonymous namespace

const char *to_string(ExitOutcome::Kind kind) {
  switch (kind) {
  case ExitOutcome::Kind::Exited:
    return "Exited";
  case ExitOutcome::Kind::Signaled:
    return "Signaled";
  case ExitOutcome::Kind::Canceled:
    return "Canceled";
  case ExitOutcome::Kind::HangTimeout:
    return "HangTimeout";
  case ExitOutcome::Kind::TerminationFailed:
    return "TerminationFailed";
  }
  return "Unknown";
}

// **---- ProcessHandle ----**

ProcessHandle::ProcessHandle(Key, pid_t pid, int stdout_fd, int stderr_fd,
                             std::string executable)
    : pid_(pid), fds_{stdout_fd, stderr_fd},
      executable_(std::move(executable)), start_time_(Clock::now()) {}

ProcessHandle::~ProcessHandle() {
  close_pipes();

  std::lock_guard<std::mutex> lock(mutex_);
  if (reaped_)
    return;

  /// Still running: never leave it behind
  ::kill(-pid_, SIGKILL);
  ::kill(pid_, SIGKILL);
  for (int i = 0; i < 20; ++i) {
    if (::waitpid(pid_, nullptr, WNOHANG) != 0)
      return;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  LOG_WARN("Process {} did not die after SIGKILL, reaping in background",
           pid_);
  pid_t pid = pid_;
  std::thread([pid]() { ::waitpid(pid, nullptr, 0); }).detach();
}

bool ProcessHandle::exited() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reaped_;
}

void ProcessHandle::close_pipes() {
  close_fd(fds_[0]);
  close_fd(fds_[1]);
}

// **---- ProcessSupervisor ----**

ProcessSupervisor::ProcessSupervisor(SupervisorSettings settings)
    : settings_(settings) {
  if (settings_.kill_attempts < 1)
    settings_.kill_attempts = 1;
}

std::unique_ptr<ProcessHandle>
ProcessSupervisor::start(const std::string &executable,
                         const ArgumentList &arguments,
                         const std::string &working_dir) {
  if (executable.empty())
    throw SpawnError("No executable given");

  /// Paths are checked up front for a precise message; bare names are
  /// resolved by execvp and reported through the status pipe
  if (executable.find('/') != std::string::npos) {
    struct stat st;
    if (::stat(executable.c_str(), &st) == -1) {
      throw SpawnError(fmt::format("Executable '{}' not found: {}", executable,
                                   errno_message(errno)));
    }
    if (!S_ISREG(st.st_mode) || ::access(executable.c_str(), X_OK) == -1) {
      throw SpawnError(
          fmt::format("Executable '{}' is not executable", executable));
    }
  }

  if (!working_dir.empty() && !std::filesystem::is_directory(working_dir)) {
    throw SpawnError(
        fmt::format("Working directory '{}' does not exist", working_dir));
  }

  Pipe out, err, status;
  out.open();
  err.open();
  status.open();

  /// Build argv before fork; the child must not allocate
  std::vector<std::string> storage;
  storage.reserve(arguments.size() + 1);
  storage.push_back(executable);
  storage.insert(storage.end(), arguments.begin(), arguments.end());
  std::vector<char *> argv;
  argv.reserve(storage.size() + 1);
  for (auto &arg : storage)
    argv.push_back(arg.data());
  argv.push_back(nullptr);

  const char *cwd = working_dir.empty() ? nullptr : working_dir.c_str();

  pid_t pid = ::fork();
  if (pid == -1)
    throw SpawnError(fmt::format("fork failed: {}", errno_message(errno)));

  if (pid == 0)
    exec_child(out, err, status, cwd, argv);

  // **---- PARENT ----**

  ::setpgid(pid, pid);
  close_fd(out.write_end);
  close_fd(err.write_end);
  close_fd(status.write_end);

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(status.read_end, &child_errno, sizeof(child_errno));
  } while (n == -1 && errno == EINTR);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    wait_for_child(pid);
    throw SpawnError(fmt::format("Cannot execute '{}': {}", executable,
                                 errno_message(child_errno)));
  }

  for (int fd : {out.read_end, err.read_end}) {
    int flags = ::fcntl(fd, F_GETFL);
    if (flags == -1 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
      int e = errno;
      ::kill(-pid, SIGKILL);
      wait_for_child(pid);
      throw SpawnError(
          fmt::format("fcntl O_NONBLOCK failed: {}", errno_message(e)));
    }
  }

  auto handle = std::make_unique<ProcessHandle>(
      ProcessHandle::Key(), pid, out.read_end, err.read_end, executable);
  out.read_end = -1;
  err.read_end = -1;

  LOG_INFO("Started '{}' (pid {})",
           std::filesystem::path(executable).filename().string(), pid);
  return handle;
}

void ProcessSupervisor::cancel(ProcessHandle &handle) {
  std::lock_guard<std::mutex> lock(handle.mutex_);
  if (handle.reaped_ || handle.cancel_requested_.load())
    return;

  handle.cancel_time_ = Clock::now();
  handle.cancel_requested_.store(true);
  if (::kill(-handle.pid_, SIGINT) == -1)
    ::kill(handle.pid_, SIGINT);
  LOG_INFO("Interrupt sent to pid {}", handle.pid_);
}

bool ProcessSupervisor::signal_group(ProcessHandle &handle, int sig) {
  std::lock_guard<std::mutex> lock(handle.mutex_);
  if (handle.reaped_)
    return false;
  if (::kill(-handle.pid_, sig) == -1)
    ::kill(handle.pid_, sig);
  return true;
}

bool ProcessSupervisor::try_reap(ProcessHandle &handle) {
  std::lock_guard<std::mutex> lock(handle.mutex_);
  if (handle.reaped_)
    return true;

  int status = 0;
  pid_t r;
  do {
    r = ::waitpid(handle.pid_, &status, WNOHANG);
  } while (r == -1 && errno == EINTR);

  if (r == handle.pid_) {
    handle.reaped_ = true;
    handle.wait_status_ = status;
  } else if (r == -1 && errno == ECHILD) {
    /// Reaped elsewhere; nothing left to wait for
    handle.reaped_ = true;
    handle.wait_status_ = 0;
  }
  return handle.reaped_;
}

bool ProcessSupervisor::force_terminate(ProcessHandle &handle) {
  for (int attempt = 1; attempt <= settings_.kill_attempts; ++attempt) {
    if (!signal_group(handle, SIGKILL))
      return true;

    auto deadline = Clock::now() + settings_.kill_wait;
    while (Clock::now() < deadline) {
      if (try_reap(handle))
        return true;
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    LOG_WARN("pid {} survived SIGKILL (attempt {}/{})", handle.pid_, attempt,
             settings_.kill_attempts);
  }
  return try_reap(handle);
}

ExitOutcome ProcessSupervisor::await_exit(ProcessHandle &handle,
                                          const OutputSink &sink) {
  std::vector<char> buffer(READ_CHUNK_SIZE);
  auto last_output = Clock::now();
  bool escalated = false;
  bool hung = false;

  /// Read what is available on one pipe, at most budget bytes; closes the
  /// pipe on EOF or error
  auto drain = [&](int index, size_t budget) {
    int &fd = handle.fds_[index];
    size_t consumed = 0;
    while (fd >= 0 && consumed < budget) {
      ssize_t n = ::read(fd, buffer.data(),
                         std::min(buffer.size(), budget - consumed));
      if (n > 0) {
        consumed += static_cast<size_t>(n);
        last_output = Clock::now();
        if (sink)
          sink(static_cast<OutputStream>(index),
               std::string_view(buffer.data(), static_cast<size_t>(n)));
        continue;
      }
      if (n == -1 && errno == EINTR)
        continue;
      if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK))
        return;
      close_fd(fd);
    }
  };

  while (true) {
    pollfd pfds[2];
    int indices[2];
    nfds_t count = 0;
    for (int i = 0; i < 2; ++i) {
      if (handle.fds_[i] >= 0) {
        pfds[count].fd = handle.fds_[i];
        pfds[count].events = POLLIN;
        pfds[count].revents = 0;
        indices[count] = i;
        ++count;
      }
    }

    if (count > 0) {
      int ready = ::poll(pfds, count, POLL_INTERVAL_MS);
      if (ready > 0) {
        for (nfds_t i = 0; i < count; ++i) {
          if (pfds[i].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL))
            drain(indices[i], DRAIN_BUDGET);
        }
      } else if (ready == -1 && errno != EINTR) {
        LOG_ERROR("poll failed for pid {}: {}", handle.pid_,
                  errno_message(errno));
        handle.close_pipes();
      }
    } else {
      std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
    }

    if (try_reap(handle))
      break;

    auto now = Clock::now();

    if (handle.cancel_requested_.load()) {
      Clock::time_point cancel_time;
      {
        std::lock_guard<std::mutex> lock(handle.mutex_);
        cancel_time = handle.cancel_time_;
      }
      if (!escalated && now - cancel_time >= settings_.termination_grace_period) {
        escalated = true;
        LOG_WARN("pid {} ignored interrupt for {} ms, killing", handle.pid_,
                 settings_.termination_grace_period.count());
        if (!force_terminate(handle))
          break;
      }
    } else if (now - last_output >= settings_.output_silence_timeout) {
      hung = true;
      LOG_WARN("pid {} produced no output for {} ms, presumed hung",
               handle.pid_, settings_.output_silence_timeout.count());
      if (!force_terminate(handle))
        break;
    }
  }

  /// Pick up output written just before exit; bounded in case a surviving
  /// grandchild keeps the pipe open and busy
  drain(0, DRAIN_BUDGET);
  drain(1, DRAIN_BUDGET);
  handle.close_pipes();

  ExitOutcome outcome;
  outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      Clock::now() - handle.start_time_);

  std::lock_guard<std::mutex> lock(handle.mutex_);
  if (!handle.reaped_) {
    LOG_ERROR("pid {} could not be terminated after {} attempts", handle.pid_,
              settings_.kill_attempts);
    outcome.kind = ExitOutcome::Kind::TerminationFailed;
    return outcome;
  }

  int status = handle.wait_status_;
  if (WIFEXITED(status))
    outcome.exit_code = WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    outcome.signal = WTERMSIG(status);

  if (hung) {
    outcome.kind = ExitOutcome::Kind::HangTimeout;
  } else if (handle.cancel_requested_.load()) {
    outcome.kind = ExitOutcome::Kind::Canceled;
  } else if (WIFSIGNALED(status)) {
    outcome.kind = ExitOutcome::Kind::Signaled;
  } else {
    outcome.kind = ExitOutcome::Kind::Exited;
  }
  return outcome;
}

} // namespace media_convert
