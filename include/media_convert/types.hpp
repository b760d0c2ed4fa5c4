/**
 * @file types.hpp
 * @brief Core data types shared by the queue, parser and event bus
 *
 * @details Contains:
 *          - Job identifiers and lifecycle states
 *
 *          - Progress and status value objects produced by the parser
 *
 *          - JobEvent, the unit delivered over the event bus
 */

#ifndef MEDIA_CONVERT_TYPES_HPP
#define MEDIA_CONVERT_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "errors.hpp"

namespace media_convert {

// **----- IDENTIFIERS -----**

using JobId = std::uint64_t;
using Clock = std::chrono::steady_clock;
using ArgumentList = std::vector<std::string>;

// **----- JOB LIFECYCLE -----**

/**
 * @enum JobState
 * @brief Pending -> Running -> {Succeeded, Failed, Canceled}.
 * @note Canceled is also reachable directly from Pending. Terminal states
 *       never change again.
 */
enum class JobState { Pending, Running, Succeeded, Failed, Canceled };

const char *to_string(JobState state);

inline bool is_terminal(JobState state) {
  return state == JobState::Succeeded || state == JobState::Failed ||
         state == JobState::Canceled;
}

// **----- PARSER OUTPUT -----**

/**
 * @struct ProgressEvent
 * @brief One progress sample parsed from encoder output.
 * @note Times are media seconds. speed is the encoder's realtime factor
 *       (2.0 = twice realtime), 0 when not reported.
 */
struct ProgressEvent {
  double position = 0.0;     //< Media time encoded so far
  double duration = 0.0;     //< Total media time, 0 if unknown
  double percent = 0.0;      //< 0..100, 0 if duration unknown
  double speed = 0.0;        //< Instantaneous realtime factor
  double bitrate_kbps = 0.0; //< Output bitrate, 0 if not reported
};

/**
 * @struct StatusEvent
 * @brief Terminal status derived from the encoder exit code.
 */
struct StatusEvent {
  bool success = false;
  int exit_code = 0;
  std::string reason;                   //< Human readable failure reason
  std::vector<std::string> diagnostics; //< Last stderr lines, oldest first
};

/**
 * @struct Progress
 * @brief Accumulated progress of one job.
 */
struct Progress {
  double position = 0.0;
  double duration = 0.0;
  double percent = 0.0;
  double speed = 0.0;         //< Last reported realtime factor
  double average_speed = 0.0; //< position / wall seconds since start
  double bitrate_kbps = 0.0;
  double remaining_sec = -1.0; //< Estimated wall seconds left, -1 unknown
};

// **----- EVENTS -----**

enum class EventKind { Started, Progress, Succeeded, Failed, Canceled };

const char *to_string(EventKind kind);

/**
 * @struct JobEvent
 * @brief Notification delivered to subscribers, tagged with the job id.
 * @note sequence is assigned by the event bus, starts at 1 and increases by
 *       one per published event of the same job.
 */
struct JobEvent {
  JobId job_id = 0;
  EventKind kind = EventKind::Progress;
  std::uint64_t sequence = 0;
  Progress progress;
  ErrorKind error = ErrorKind::None;
  std::string reason;

  bool is_terminal() const {
    return kind == EventKind::Succeeded || kind == EventKind::Failed ||
           kind == EventKind::Canceled;
  }
};

} // namespace media_convert

#endif // MEDIA_CONVERT_TYPES_HPP
