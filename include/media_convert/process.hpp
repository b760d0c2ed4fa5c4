/**
 * @file process.hpp
 * @brief Supervised execution of external encoder processes
 *
 * @details The ProcessSupervisor spawns a child process with its stdout and
 *          stderr connected to pipes, streams every chunk of output to a
 *          caller-supplied sink, and guarantees the child is reaped:
 *
 *          - Liveness: if neither pipe produces output for
 *            output_silence_timeout, the process is killed and the outcome is
 *            HangTimeout
 *
 *          - Cancel: SIGINT first, SIGKILL once the grace period expires
 *
 *          - Termination is confirmed with waitpid; after kill_attempts
 *            unanswered SIGKILLs the outcome is TerminationFailed
 *
 * @attention THREAD MODEL:
 *
 *   - await_exit() blocks the calling thread only; run one per process
 *
 *   - cancel() may be called from any thread while another thread is inside
 *     await_exit(); it never blocks
 *
 * @note The child runs in its own process group, so signals also reach any
 *       helper processes the encoder starts.
 */

#ifndef MEDIA_CONVERT_PROCESS_HPP
#define MEDIA_CONVERT_PROCESS_HPP

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "config.hpp"
#include "output_parser.hpp"
#include "types.hpp"

namespace media_convert {

/**
 * @struct ExitOutcome
 * @brief How a supervised process ended.
 */
struct ExitOutcome {
  enum class Kind {
    Exited,            //< Normal exit, see exit_code
    Signaled,          //< Killed by a signal nobody here sent
    Canceled,          //< Ended after cancel()
    HangTimeout,       //< Killed after output_silence_timeout
    TerminationFailed, //< Still alive after every kill attempt
  };

  Kind kind = Kind::Exited;
  int exit_code = -1; //< Valid for Exited
  int signal = 0;     //< Terminating signal, 0 if none
  std::chrono::milliseconds elapsed{0};

  bool success() const { return kind == Kind::Exited && exit_code == 0; }
};

const char *to_string(ExitOutcome::Kind kind);

/**
 * @class ProcessHandle
 * @brief One live child process.
 * @note Owned exclusively by the code that started it. Destroying a handle
 *       whose process is still running kills and reaps it.
 */
class ProcessHandle {
  /// Restricts construction to ProcessSupervisor
  class Key {
    friend class ProcessSupervisor;
    Key() = default;
  };

public:
  ProcessHandle(Key, pid_t pid, int stdout_fd, int stderr_fd,
                std::string executable);
  ~ProcessHandle();

  /// Disable copy
  ProcessHandle(const ProcessHandle &) = delete;
  ProcessHandle &operator=(const ProcessHandle &) = delete;

  pid_t pid() const { return pid_; }
  const std::string &executable() const { return executable_; }

  /// True once the process has been reaped
  bool exited() const;

  /// True once cancel() was requested
  bool cancel_requested() const { return cancel_requested_.load(); }

private:
  friend class ProcessSupervisor;

  void close_pipes();

  pid_t pid_;
  int fds_[2]; //< Read ends, indexed by OutputStream, -1 when closed
  std::string executable_;

  mutable std::mutex mutex_; //< Guards reaping vs. signaling
  bool reaped_ = false;
  int wait_status_ = 0;

  std::atomic<bool> cancel_requested_{false};
  Clock::time_point cancel_time_;
  Clock::time_point start_time_;
};

/// Receives each chunk read from the child's stdout or stderr
using OutputSink = std::function<void(OutputStream, std::string_view)>;

/**
 * @class ProcessSupervisor
 * @brief Starts, watches and terminates external processes.
 * @note Stateless apart from its settings; one instance serves any number of
 *       concurrent processes.
 */
class ProcessSupervisor {
public:
  explicit ProcessSupervisor(SupervisorSettings settings = {});

  /**
   * @brief Spawn a process.
   *
   * @param executable Path, or bare name looked up in PATH
   * @param arguments Arguments, without argv[0]
   * @param working_dir Child working directory, empty = inherit
   * @return Handle owning the running process
   * @throws SpawnError if the executable is missing, not executable, or
   *         exec fails in the child
   */
  std::unique_ptr<ProcessHandle> start(const std::string &executable,
                                       const ArgumentList &arguments,
                                       const std::string &working_dir = {});

  /**
   * @brief Request graceful termination.
   * @note Sends SIGINT and returns; the thread in await_exit() escalates to
   *       SIGKILL after the grace period. No-op if already requested or the
   *       process has exited.
   */
  void cancel(ProcessHandle &handle);

  /**
   * @brief Stream output until the process is gone.
   *
   * @param handle Process to watch
   * @param sink Called for every chunk, on the calling thread
   * @return Outcome; the process is reaped unless TerminationFailed
   */
  ExitOutcome await_exit(ProcessHandle &handle, const OutputSink &sink);

  const SupervisorSettings &settings() const { return settings_; }

private:
  /// Send sig to the process group unless reaped; false if already reaped
  bool signal_group(ProcessHandle &handle, int sig);

  /// Non-blocking waitpid; true once reaped
  bool try_reap(ProcessHandle &handle);

  /// SIGKILL with bounded retries; true once reaped
  bool force_terminate(ProcessHandle &handle);

  SupervisorSettings settings_;
};

} // namespace media_convert

#endif // MEDIA_CONVERT_PROCESS_HPP
