/**
 * @file types.cpp
 * @brief String conversions for enums shared across modules
 */

#include "media_convert/types.hpp"

namespace media_convert {

const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "None";
  case ErrorKind::InvalidProfile:
    return "InvalidProfile";
  case ErrorKind::Spawn:
    return "Spawn";
  case ErrorKind::HangTimeout:
    return "HangTimeout";
  case ErrorKind::TerminationFailed:
    return "TerminationFailed";
  case ErrorKind::DuplicateDestination:
    return "DuplicateDestination";
  case ErrorKind::SourceMissing:
    return "SourceMissing";
  case ErrorKind::Probe:
    return "Probe";
  case ErrorKind::ProcessFailed:
    return "ProcessFailed";
  }
  return "Unknown";
}

const char *to_string(JobState state) {
  switch (state) {
  case JobState::Pending:
    return "Pending";
  case JobState::Running:
    return "Running";
  case JobState::Succeeded:
    return "Succeeded";
  case JobState::Failed:
    return "Failed";
  case JobState::Canceled:
    return "Canceled";
  }
  return "Unknown";
}

const char *to_string(EventKind kind) {
  switch (kind) {
  case EventKind::Started:
    return "Started";
  case EventKind::Progress:
    return "Progress";
  case EventKind::Succeeded:
    return "Succeeded";
  case EventKind::Failed:
    return "Failed";
  case EventKind::Canceled:
    return "Canceled";
  }
  return "Unknown";
}

} // namespace media_convert
