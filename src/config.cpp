/**
 * @file config.cpp
 * @brief Settings loaded from the environment
 */

#include "media_convert/config.hpp"

#include "media_convert/logging.hpp"
#include "media_convert/system.hpp"

namespace media_convert {

namespace {

std::chrono::milliseconds seconds_to_ms(double seconds) {
  return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

} // anonymous namespace

SupervisorSettings SupervisorSettings::from_environment() {
  SupervisorSettings s;
  s.output_silence_timeout = seconds_to_ms(Config::output_silence_timeout_sec());
  s.termination_grace_period = seconds_to_ms(Config::termination_grace_sec());
  s.kill_attempts = Config::kill_attempts();

  if (s.output_silence_timeout.count() <= 0) {
    LOG_WARN("OUTPUT_SILENCE_TIMEOUT_SEC must be positive, using 60");
    s.output_silence_timeout = std::chrono::milliseconds(60000);
  }
  if (s.termination_grace_period.count() < 0) {
    LOG_WARN("TERMINATION_GRACE_SEC must not be negative, using 3");
    s.termination_grace_period = std::chrono::milliseconds(3000);
  }
  if (s.kill_attempts < 1) {
    LOG_WARN("KILL_ATTEMPTS must be at least 1, using 1");
    s.kill_attempts = 1;
  }
  return s;
}

QueueSettings QueueSettings::from_environment() {
  QueueSettings s;
  s.max_concurrent_jobs = effective_concurrency(Config::max_concurrent_jobs());
  s.encoder_path = Config::encoder_path();
  s.probe_sources = Config::probe_sources();
  s.probe_timeout = seconds_to_ms(Config::probe_timeout_sec());
  s.overwrite_output = Config::overwrite_output();
  s.progress_pipe = Config::progress_pipe();
  s.remove_partial_output = Config::remove_partial_output();
  s.supervisor = SupervisorSettings::from_environment();

  int tail = Config::diagnostic_tail_lines();
  s.diagnostic_tail_lines = tail > 0 ? static_cast<std::size_t>(tail) : 0;
  return s;
}

} // namespace media_convert
