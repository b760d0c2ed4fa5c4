/**
 * @file errors.hpp
 * @brief Error taxonomy for profile, process and queue failures
 *
 * @details Errors raised at API boundaries are exceptions derived from
 *          media_convert::Error. Errors that happen while a job executes are
 *          caught by the job's worker and recorded as an ErrorKind plus a
 *          reason string in the job outcome; they never cross into other jobs.
 */

#ifndef MEDIA_CONVERT_ERRORS_HPP
#define MEDIA_CONVERT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace media_convert {

/**
 * @enum ErrorKind
 * @brief Classification carried by exceptions and by failed job outcomes.
 */
enum class ErrorKind {
  None,                 //< No error
  InvalidProfile,       //< Profile validation failed, enqueue rejected
  Spawn,                //< Executable missing, unauthorized or exec failed
  HangTimeout,          //< No output within the silence window
  TerminationFailed,    //< Process survived every kill attempt
  DuplicateDestination, //< Another active job writes the same file
  SourceMissing,        //< Source file vanished before dispatch
  Probe,                //< In-process media probe failed
  ProcessFailed,        //< Encoder exited non-zero or died on a signal
};

/// Stable name of an error kind, used in logs and reasons
const char *to_string(ErrorKind kind);

/**
 * @class Error
 * @brief Base of every exception thrown by this library.
 */
class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

class InvalidProfileError : public Error {
public:
  explicit InvalidProfileError(const std::string &message)
      : Error(ErrorKind::InvalidProfile, message) {}
};

class SpawnError : public Error {
public:
  explicit SpawnError(const std::string &message)
      : Error(ErrorKind::Spawn, message) {}
};

class DuplicateDestinationError : public Error {
public:
  explicit DuplicateDestinationError(const std::string &message)
      : Error(ErrorKind::DuplicateDestination, message) {}
};

class ProbeError : public Error {
public:
  explicit ProbeError(const std::string &message)
      : Error(ErrorKind::Probe, message) {}
};

} // namespace media_convert

#endif // MEDIA_CONVERT_ERRORS_HPP
