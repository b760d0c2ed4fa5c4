/**
 * @file job_queue.cpp
 * @brief Job queue, scheduler and per-job worker
 */

#include "media_convert/job_queue.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <stdexcept>
#include <system_error>

#include <fmt/core.h>

#include "media_convert/errors.hpp"
#include "media_convert/logging.hpp"
#include "media_convert/media_probe.hpp"
#include "media_convert/output_parser.hpp"
#include "media_convert/system.hpp"

namespace media_convert {

namespace fs = std::filesystem;

namespace {

std::string normalize_path(const std::string &path) {
  return fs::absolute(fs::path(path)).lexically_normal().string();
}

EventKind event_kind_for(JobState state) {
  switch (state) {
  case JobState::Succeeded:
    return EventKind::Succeeded;
  case JobState::Failed:
    return EventKind::Failed;
  case JobState::Canceled:
    return EventKind::Canceled;
  default:
    return EventKind::Progress;
  }
}

JobOutcome make_outcome(ErrorKind error, std::string reason) {
  JobOutcome outcome;
  outcome.error = error;
  outcome.reason = std::move(reason);
  return outcome;
}

} // anonymous namespace

// **---- HandleRegistration ----**

JobQueue::HandleRegistration::HandleRegistration(JobQueue &queue, JobId id,
                                                 ProcessHandle &handle)
    : queue_(queue), id_(id) {
  std::lock_guard<std::mutex> lock(queue_.mutex_);
  Slot &slot = queue_.slots_.at(id_);
  slot.handle = &handle;
  /// cancel() arrived between promotion and spawn
  if (slot.cancel_requested)
    queue_.supervisor_.cancel(handle);
}

JobQueue::HandleRegistration::~HandleRegistration() {
  std::lock_guard<std::mutex> lock(queue_.mutex_);
  queue_.slots_.at(id_).handle = nullptr;
}

// **---- JobQueue ----**

JobQueue::JobQueue(const ProfileCatalog &catalog,
                   ProcessSupervisor &supervisor, EventBus &bus,
                   QueueSettings settings)
    : catalog_(catalog), supervisor_(supervisor), bus_(bus),
      settings_(std::move(settings)) {
  settings_.max_concurrent_jobs =
      effective_concurrency(settings_.max_concurrent_jobs);
}

JobQueue::~JobQueue() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutting_down_ = true;
  }
  cancel_all();

  std::vector<std::thread> workers;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return running_ == 0; });
    for (auto &entry : slots_) {
      if (entry.second.worker.joinable())
        workers.push_back(std::move(entry.second.worker));
    }
    finished_workers_.clear();
  }
  for (auto &worker : workers)
    worker.join();
}

JobId JobQueue::enqueue(const std::string &source,
                        const std::string &destination,
                        const std::string &profile_id, JobOptions options) {
  return enqueue(source, destination, catalog_.get(profile_id), options);
}

JobId JobQueue::enqueue(const std::string &source,
                        const std::string &destination, ProfilePtr profile,
                        JobOptions options) {
  if (!profile)
    throw InvalidProfileError("No profile given");
  if (source.empty() || destination.empty())
    throw std::invalid_argument("Source and destination must not be empty");

  std::string normalized = normalize_path(destination);

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &entry : slots_) {
    const Job &other = entry.second.job;
    if ((other.state == JobState::Pending ||
         other.state == JobState::Running) &&
        other.destination == normalized) {
      throw DuplicateDestinationError(
          fmt::format("Job {} already writes '{}'", other.id, normalized));
    }
  }

  JobId id = next_id_++;
  Slot &slot = slots_[id];
  slot.job.id = id;
  slot.job.source = source;
  slot.job.destination = normalized;
  slot.job.profile = std::move(profile);
  slot.job.options = options;
  slot.job.enqueued_at = Clock::now();
  pending_.push_back(id);

  LOG_JOB(INFO, id, "Queued {} -> {} ({})", source, normalized,
          slot.job.profile->id());

  schedule_locked();
  return id;
}

bool JobQueue::cancel(JobId id) {
  std::unique_lock<std::mutex> lock(mutex_);
  auto it = slots_.find(id);
  if (it == slots_.end() || is_terminal(it->second.job.state))
    return false;

  Slot &slot = it->second;
  if (slot.job.state == JobState::Pending) {
    cancel_pending_locked(slot);
    cv_.notify_all();
    return true;
  }

  request_cancel_locked(slot);
  cv_.wait(lock, [&slot] { return is_terminal(slot.job.state); });
  return true;
}

void JobQueue::cancel_all() {
  std::unique_lock<std::mutex> lock(mutex_);

  std::vector<JobId> pending(pending_.begin(), pending_.end());
  for (JobId id : pending)
    cancel_pending_locked(slots_.at(id));

  std::vector<JobId> running;
  for (auto &entry : slots_) {
    if (entry.second.job.state == JobState::Running) {
      request_cancel_locked(entry.second);
      running.push_back(entry.first);
    }
  }
  cv_.notify_all();

  cv_.wait(lock, [this, &running] {
    return std::all_of(running.begin(), running.end(), [this](JobId id) {
      return is_terminal(slots_.at(id).job.state);
    });
  });
}

bool JobQueue::forget(JobId id) {
  std::thread worker;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(id);
    if (it == slots_.end() || !is_terminal(it->second.job.state))
      return false;
    worker = std::move(it->second.worker);
    finished_workers_.erase(
        std::remove(finished_workers_.begin(), finished_workers_.end(), id),
        finished_workers_.end());
    slots_.erase(it);
  }
  /// The worker is past complete() and touches no slot any more
  if (worker.joinable()) {
    if (worker.get_id() == std::this_thread::get_id())
      worker.detach();
    else
      worker.join();
  }
  bus_.forget(id);
  LOG_JOB(INFO, id, "Forgotten");
  return true;
}

void JobQueue::pause() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!paused_)
    LOG_INFO("Queue paused, {} job(s) still running", running_);
  paused_ = true;
  cv_.notify_all();
}

void JobQueue::resume() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (paused_)
    LOG_INFO("Queue resumed, {} job(s) pending", pending_.size());
  paused_ = false;
  schedule_locked();
  cv_.notify_all();
}

bool JobQueue::paused() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return paused_;
}

std::optional<Job> JobQueue::job(JobId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = slots_.find(id);
  if (it == slots_.end())
    return std::nullopt;
  return it->second.job;
}

std::vector<Job> JobQueue::jobs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Job> result;
  result.reserve(slots_.size());
  for (const auto &entry : slots_)
    result.push_back(entry.second.job);
  return result;
}

std::size_t JobQueue::running_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

std::size_t JobQueue::pending_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

QueueTotals JobQueue::totals() const {
  std::lock_guard<std::mutex> lock(mutex_);
  QueueTotals totals;

  auto weight_of = [](const Job &job) {
    return job.source_duration > 0.0 ? job.source_duration
                                     : job.progress.duration;
  };

  bool all_weighted = true;
  for (const auto &entry : slots_) {
    const Job &job = entry.second.job;
    switch (job.state) {
    case JobState::Pending:
      ++totals.pending;
      break;
    case JobState::Running:
      ++totals.running;
      break;
    case JobState::Succeeded:
      ++totals.succeeded;
      break;
    case JobState::Failed:
      ++totals.failed;
      break;
    case JobState::Canceled:
      ++totals.canceled;
      continue;
    }
    if (weight_of(job) <= 0.0)
      all_weighted = false;
  }

  double total = 0.0;
  double done = 0.0;
  for (const auto &entry : slots_) {
    const Job &job = entry.second.job;
    if (job.state == JobState::Canceled)
      continue;
    double weight = all_weighted ? weight_of(job) : 1.0;
    double fraction = 0.0;
    if (job.state == JobState::Running)
      fraction = job.progress.percent / 100.0;
    else if (is_terminal(job.state))
      fraction = 1.0;
    total += weight;
    done += weight * fraction;
  }
  if (total > 0.0)
    totals.overall_percent = std::min(100.0, done / total * 100.0);
  return totals;
}

bool JobQueue::wait_idle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this] { return idle_locked(); });
}

// **---- Scheduling ----**

void JobQueue::schedule_locked() {
  join_finished_locked();
  if (paused_ || shutting_down_)
    return;

  while (running_ < static_cast<std::size_t>(settings_.max_concurrent_jobs) &&
         !pending_.empty()) {
    JobId id = pending_.front();
    pending_.pop_front();

    Slot &slot = slots_.at(id);
    slot.job.state = JobState::Running;
    slot.job.started_at = Clock::now();
    ++running_;

    LOG_JOB(INFO, id, "Running ({} of max {})", running_,
            settings_.max_concurrent_jobs);
    bus_.publish(make_event_locked(slot, EventKind::Started));

    try {
      slot.worker = std::thread(&JobQueue::run_job, this, id);
    } catch (const std::system_error &e) {
      --running_;
      slot.job.state = JobState::Failed;
      slot.job.finished_at = Clock::now();
      slot.job.outcome = make_outcome(
          ErrorKind::Spawn,
          fmt::format("Cannot start worker thread: {}", e.what()));
      LOG_JOB(ERROR, id, "{}", slot.job.outcome.reason);
      bus_.publish(make_event_locked(slot, EventKind::Failed));
    }
  }
}

void JobQueue::join_finished_locked() {
  for (JobId id : finished_workers_) {
    std::thread &worker = slots_.at(id).worker;
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id())
      worker.join();
  }
  finished_workers_.clear();
}

void JobQueue::cancel_pending_locked(Slot &slot) {
  auto it = std::find(pending_.begin(), pending_.end(), slot.job.id);
  if (it != pending_.end())
    pending_.erase(it);

  slot.job.state = JobState::Canceled;
  slot.job.finished_at = Clock::now();
  slot.job.outcome =
      make_outcome(ErrorKind::None, "Canceled before the encoder started");
  LOG_JOB(INFO, slot.job.id, "Canceled while pending");
  bus_.publish(make_event_locked(slot, EventKind::Canceled));
}

void JobQueue::request_cancel_locked(Slot &slot) {
  if (slot.cancel_requested)
    return;
  slot.cancel_requested = true;
  LOG_JOB(INFO, slot.job.id, "Cancel requested");
  if (slot.handle)
    supervisor_.cancel(*slot.handle);
}

bool JobQueue::idle_locked() const {
  return running_ == 0 && (pending_.empty() || paused_);
}

JobEvent JobQueue::make_event_locked(const Slot &slot, EventKind kind) const {
  JobEvent event;
  event.job_id = slot.job.id;
  event.kind = kind;
  event.progress = slot.job.progress;
  event.error = slot.job.outcome.error;
  event.reason = slot.job.outcome.reason;
  return event;
}

// **---- Worker ----**

void JobQueue::run_job(JobId id) {
  try {
    execute_job(id);
  } catch (const Error &e) {
    LOG_JOB(ERROR, id, "{}", e.what());
    complete(id, JobState::Failed, make_outcome(e.kind(), e.what()));
  } catch (const std::exception &e) {
    LOG_JOB(ERROR, id, "Unexpected error: {}", e.what());
    complete(id, JobState::Failed,
             make_outcome(ErrorKind::ProcessFailed,
                          fmt::format("Unexpected error: {}", e.what())));
  }
}

void JobQueue::execute_job(JobId id) {
  std::string source;
  std::string destination;
  ProfilePtr profile;
  JobOptions options;
  const std::atomic<bool> *cancel_flag = nullptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot &slot = slots_.at(id);
    cancel_flag = &slot.cancel_requested;
    const Job &job = slot.job;
    source = job.source;
    destination = job.destination;
    profile = job.profile;
    options = job.options;
  }

  std::error_code ec;
  if (!fs::exists(source, ec)) {
    LOG_JOB(ERROR, id, "Source not found: {}", source);
    complete(id, JobState::Failed,
             make_outcome(ErrorKind::SourceMissing,
                          fmt::format("Source file not found: {}", source)));
    return;
  }

  // **---- PROBE ----**

  double source_duration = 0.0;
  if (settings_.probe_sources) {
    try {
      MediaInfo info =
          probe_media(source, settings_.probe_timeout, cancel_flag);
      source_duration = info.duration;
      LOG_JOB(INFO, id, "Source {} ({}), {}", format_time(info.duration),
              info.format_name,
              info.has_video ? info.video_codec : std::string("audio only"));
    } catch (const ProbeError &e) {
      /// Not fatal: the encoder may still read it and report a duration
      LOG_JOB(WARN, id, "{}", e.what());
    }
    std::lock_guard<std::mutex> lock(mutex_);
    Job &job = slots_.at(id).job;
    job.source_duration = source_duration;
    job.progress.duration = source_duration;
  }

  if (cancel_requested(id)) {
    complete(id, JobState::Canceled,
             make_outcome(ErrorKind::None,
                          "Canceled before the encoder started"));
    return;
  }

  // **---- SPAWN ----**

  bool destination_existed = fs::exists(destination, ec);

  CommandOptions command_options;
  command_options.overwrite = settings_.overwrite_output;
  command_options.progress_pipe = settings_.progress_pipe;
  if (options.insert_subtitles) {
    if (profile->kind() != MediaKind::AudioVideo) {
      LOG_JOB(INFO, id, "Profile '{}' has no video, subtitles skipped",
              profile->id());
    } else {
      fs::path subtitles = fs::path(source).replace_extension(".srt");
      if (fs::is_regular_file(subtitles, ec)) {
        LOG_JOB(INFO, id, "Inserting subtitles from {}", subtitles.string());
        command_options.subtitle_path = subtitles.string();
      } else {
        LOG_JOB(INFO, id, "No subtitles found at {}", subtitles.string());
      }
    }
  }

  ArgumentList arguments = settings_.encoder_prefix_args;
  ArgumentList command =
      EncoderCommand::build(*profile, source, destination, command_options);
  arguments.insert(arguments.end(), command.begin(), command.end());

  std::unique_ptr<ProcessHandle> handle;
  try {
    handle = supervisor_.start(settings_.encoder_path, arguments,
                               settings_.working_dir);
  } catch (const SpawnError &e) {
    LOG_JOB(ERROR, id, "{}", e.what());
    complete(id, JobState::Failed, make_outcome(ErrorKind::Spawn, e.what()));
    return;
  }

  // **---- STREAM ----**

  std::unique_ptr<LineRules> rules;
  if (settings_.progress_pipe)
    rules = std::make_unique<FfmpegProgressRules>();
  OutputParser parser(std::move(rules), settings_.diagnostic_tail_lines);
  parser.set_fallback_duration(source_duration);

  Clock::time_point started = Clock::now();
  ExitOutcome exit_outcome;
  {
    HandleRegistration registration(*this, id, *handle);
    exit_outcome = supervisor_.await_exit(
        *handle, [&](OutputStream stream, std::string_view chunk) {
          for (const auto &event : parser.feed(chunk, stream))
            publish_progress(id, event, started);
        });
    for (const auto &event : parser.flush())
      publish_progress(id, event, started);
  }
  handle.reset();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    slots_.at(id).job.parse_warnings = parser.parse_warning_count();
  }
  if (parser.parse_warning_count() > 0) {
    LOG_JOB(WARN, id, "{} malformed output line(s) ignored",
            parser.parse_warning_count());
  }

  // **---- OUTCOME ----**

  JobState state = JobState::Failed;
  JobOutcome outcome;
  outcome.exit_code = exit_outcome.exit_code;
  const auto &tail = parser.diagnostics();

  switch (exit_outcome.kind) {
  case ExitOutcome::Kind::Canceled:
    state = JobState::Canceled;
    outcome.reason = "Canceled by user";
    break;

  case ExitOutcome::Kind::HangTimeout:
    outcome.error = ErrorKind::HangTimeout;
    outcome.reason = fmt::format(
        "Encoder produced no output for {:.0f} s and was killed",
        supervisor_.settings().output_silence_timeout.count() / 1000.0);
    outcome.diagnostics.assign(tail.begin(), tail.end());
    break;

  case ExitOutcome::Kind::TerminationFailed:
    outcome.error = ErrorKind::TerminationFailed;
    outcome.reason = fmt::format("Encoder survived {} kill attempts",
                                 supervisor_.settings().kill_attempts);
    break;

  case ExitOutcome::Kind::Signaled:
    outcome.error = ErrorKind::ProcessFailed;
    outcome.reason = fmt::format("Encoder killed by signal {}", exit_outcome.signal);
    outcome.diagnostics.assign(tail.begin(), tail.end());
    break;

  case ExitOutcome::Kind::Exited:
    if (exit_outcome.exit_code == 0) {
      state = JobState::Succeeded;
    } else {
      StatusEvent status = parser.finalize(exit_outcome.exit_code);
      outcome.error = ErrorKind::ProcessFailed;
      outcome.reason = std::move(status.reason);
      outcome.diagnostics = std::move(status.diagnostics);
    }
    break;
  }

  // **---- CLEANUP ----**

  if (state != JobState::Succeeded && settings_.remove_partial_output &&
      !destination_existed) {
    if (fs::remove(destination, ec))
      LOG_JOB(INFO, id, "Removed partial output {}", destination);
    else if (ec)
      LOG_JOB(WARN, id, "Cannot remove {}: {}", destination, ec.message());
  }

  if (state == JobState::Succeeded && options.delete_source_on_success) {
    if (fs::remove(source, ec))
      LOG_JOB(INFO, id, "Deleted source {}", source);
    else
      LOG_JOB(WARN, id, "Cannot delete source {}: {}", source,
              ec ? ec.message() : std::string("not found"));
  }

  complete(id, state, std::move(outcome));
}

void JobQueue::publish_progress(JobId id, const ProgressEvent &event,
                                Clock::time_point started) {
  double wall =
      std::chrono::duration<double>(Clock::now() - started).count();

  std::lock_guard<std::mutex> lock(mutex_);
  Slot &slot = slots_.at(id);
  if (slot.job.state != JobState::Running)
    return;

  Progress &p = slot.job.progress;
  p.position = std::max(p.position, event.position);
  p.duration = event.duration;
  p.percent = std::max(p.percent, event.percent);
  p.speed = event.speed;
  p.bitrate_kbps = event.bitrate_kbps;
  p.average_speed = wall > 0.0 ? p.position / wall : 0.0;
  if (p.duration > 0.0 && p.average_speed > 0.0)
    p.remaining_sec =
        std::max(0.0, (p.duration - p.position) / p.average_speed);
  else
    p.remaining_sec = -1.0;

  bus_.publish(make_event_locked(slot, EventKind::Progress));
}

bool JobQueue::cancel_requested(JobId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return slots_.at(id).cancel_requested;
}

void JobQueue::complete(JobId id, JobState state, JobOutcome outcome) {
  std::lock_guard<std::mutex> lock(mutex_);
  Slot &slot = slots_.at(id);
  if (is_terminal(slot.job.state))
    return;

  Job &job = slot.job;
  slot.handle = nullptr;
  job.state = state;
  job.finished_at = Clock::now();
  job.outcome = std::move(outcome);
  if (state == JobState::Succeeded) {
    job.progress.percent = 100.0;
    if (job.progress.duration > 0.0)
      job.progress.position = job.progress.duration;
    job.progress.remaining_sec = 0.0;
  }
  --running_;

  double elapsed =
      std::chrono::duration<double>(job.finished_at - job.started_at).count();
  if (state == JobState::Succeeded) {
    LOG_JOB(SUCCESS, id, "Succeeded in {}", format_time(elapsed));
  } else if (state == JobState::Canceled) {
    LOG_JOB(WARN, id, "Canceled: {}", job.outcome.reason);
  } else {
    LOG_JOB(ERROR, id, "Failed ({}): {}", to_string(job.outcome.error),
            job.outcome.reason);
  }

  bus_.publish(make_event_locked(slot, event_kind_for(state)));

  /// Join earlier finishers first; this thread is joined by a later call
  schedule_locked();
  finished_workers_.push_back(id);
  cv_.notify_all();
}

} // namespace media_convert
