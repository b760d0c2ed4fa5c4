/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables, and
 *          the settings structs consumed by the process supervisor and the
 *          job queue. See config/media_convert.env for detailed documentation
 *          of each parameter.
 *
 * @note Components never read the environment themselves; they receive a
 *       settings struct. from_environment() is the only bridge, so tests can
 *       build settings directly.
 */

#ifndef MEDIA_CONVERT_CONFIG_HPP
#define MEDIA_CONVERT_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <string>
#include <vector>

namespace media_convert {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return val ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

// **---- SCHEDULING ----**

/**
 * @brief Maximum number of encoder processes running at once
 * @note 0 = one per available CPU (see detect_cpu_limit)
 */
inline int max_concurrent_jobs() {
  static int val = get_env_int("MAX_CONCURRENT_JOBS", 1);
  return val;
}

/// Capacity of each subscriber's event channel before progress is dropped
inline int event_queue_capacity() {
  static int val = get_env_int("EVENT_QUEUE_CAPACITY", 1024);
  return val;
}

// **---- PROCESS SUPERVISION ----**

/// Path or name (looked up in PATH) of the encoder executable
inline const std::string &encoder_path() {
  static std::string val = get_env_string("ENCODER_PATH", "ffmpeg");
  return val;
}

/**
 * @brief Seconds without any output before the encoder is presumed hung
 * @note Reset on every chunk read from stdout or stderr.
 */
inline double output_silence_timeout_sec() {
  static double val = get_env_double("OUTPUT_SILENCE_TIMEOUT_SEC", 60.0);
  return val;
}

/// Seconds between the interrupt signal and the forced kill on cancel
inline double termination_grace_sec() {
  static double val = get_env_double("TERMINATION_GRACE_SEC", 3.0);
  return val;
}

/// Number of SIGKILL attempts before TerminationFailed is reported
inline int kill_attempts() {
  static int val = get_env_int("KILL_ATTEMPTS", 3);
  return val;
}

// **---- JOB EXECUTION ----**

/// Probe source duration in-process before spawning the encoder
inline bool probe_sources() {
  static bool val = (get_env_int("PROBE_SOURCES", 1) != 0);
  return val;
}

/// Deadline for the in-process probe
inline double probe_timeout_sec() {
  static double val = get_env_double("PROBE_TIMEOUT_SEC", 10.0);
  return val;
}

/// Number of stderr lines attached to a failed job
inline int diagnostic_tail_lines() {
  static int val = get_env_int("DIAGNOSTIC_TAIL_LINES", 20);
  return val;
}

/// Pass -y to the encoder instead of -n
inline bool overwrite_output() {
  static bool val = (get_env_int("OVERWRITE_OUTPUT", 0) != 0);
  return val;
}

/**
 * @brief Ask the encoder for machine-readable progress on stdout
 * @note 1 = add "-progress pipe:1 -nostats" and parse key=value blocks,
 *       0 = parse the human-readable statistics line on stderr.
 */
inline bool progress_pipe() {
  static bool val = (get_env_int("PROGRESS_PIPE", 0) != 0);
  return val;
}

/// Delete the destination of a failed or canceled job if the job created it
inline bool remove_partial_output() {
  static bool val = (get_env_int("REMOVE_PARTIAL_OUTPUT", 1) != 0);
  return val;
}

} // namespace Config

// **---- SETTINGS ----**

/**
 * @struct SupervisorSettings
 * @brief Timeouts applied to every supervised process.
 */
struct SupervisorSettings {
  std::chrono::milliseconds output_silence_timeout{60000};
  std::chrono::milliseconds termination_grace_period{3000};
  std::chrono::milliseconds kill_wait{1000}; //< Wait after each SIGKILL
  int kill_attempts = 3;

  static SupervisorSettings from_environment();
};

/**
 * @struct QueueSettings
 * @brief Scheduling and execution settings of a JobQueue.
 */
struct QueueSettings {
  int max_concurrent_jobs = 1;
  std::string encoder_path = "ffmpeg";
  /// Arguments placed before the generated command line (wrappers, tests)
  std::vector<std::string> encoder_prefix_args;
  std::string working_dir; //< Empty = inherit
  bool probe_sources = true;
  std::chrono::milliseconds probe_timeout{10000};
  std::size_t diagnostic_tail_lines = 20;
  bool overwrite_output = false;
  bool progress_pipe = false;
  bool remove_partial_output = true;
  SupervisorSettings supervisor;

  static QueueSettings from_environment();
};

} // namespace media_convert

#endif // MEDIA_CONVERT_CONFIG_HPP
