/**
 * @file job_queue.hpp
 * @brief Conversion job queue and scheduler
 *
 * @details The JobQueue is the single source of truth for every job:
 *
 *          - enqueue() appends to a FIFO of Pending jobs
 *
 *          - The scheduler promotes the earliest Pending job whenever fewer
 *            than max_concurrent_jobs are Running
 *
 *          - Each Running job executes on its own worker thread: probe,
 *            spawn, stream output through an OutputParser, map the exit
 *            outcome to a terminal state
 *
 *          - Every transition is published on the EventBus
 *
 * @attention THREAD MODEL:
 *
 *   - All state transitions happen under one mutex
 *
 *   - The mutex is never held across spawn, probe or output streaming, so a
 *     stalled encoder never blocks enqueue() or cancel() of other jobs
 *
 *   - A job failure is recorded in that job only; the queue keeps going
 */

#ifndef MEDIA_CONVERT_JOB_QUEUE_HPP
#define MEDIA_CONVERT_JOB_QUEUE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "config.hpp"
#include "event_bus.hpp"
#include "process.hpp"
#include "profile.hpp"
#include "types.hpp"

namespace media_convert {

/**
 * @struct JobOptions
 * @brief Per-job switches chosen by the collaborator.
 */
struct JobOptions {
  bool delete_source_on_success = false;
  /// Burn in "<source stem>.srt" when it exists next to the source and the
  /// profile has video
  bool insert_subtitles = false;
};

/**
 * @struct JobOutcome
 * @brief Why a job ended. Empty while the job is not terminal.
 */
struct JobOutcome {
  ErrorKind error = ErrorKind::None;
  std::string reason; //< Set for every Failed/Canceled job
  int exit_code = -1; //< Encoder exit code, -1 if it never exited normally
  std::vector<std::string> diagnostics; //< Last stderr lines
};

/**
 * @struct Job
 * @brief Snapshot of one conversion job.
 */
struct Job {
  JobId id = 0;
  std::string source;
  std::string destination;
  ProfilePtr profile;
  JobOptions options;

  JobState state = JobState::Pending;
  Progress progress;
  JobOutcome outcome;

  double source_duration = 0.0; //< Probed, 0 if unknown
  std::size_t parse_warnings = 0;

  Clock::time_point enqueued_at;
  Clock::time_point started_at;  //< Valid from Running
  Clock::time_point finished_at; //< Valid once terminal
};

/**
 * @struct QueueTotals
 * @brief Queue-wide counts and overall progress.
 */
struct QueueTotals {
  std::size_t pending = 0;
  std::size_t running = 0;
  std::size_t succeeded = 0;
  std::size_t failed = 0;
  std::size_t canceled = 0;

  /// 0..100 over all jobs except canceled ones, weighted by source
  /// duration when every such job has one, equally otherwise
  double overall_percent = 0.0;
};

/**
 * @class JobQueue
 * @brief Schedules conversion jobs onto supervised encoder processes.
 * @note Owns its worker threads. The catalog, supervisor and bus must
 *       outlive the queue.
 */
class JobQueue {
public:
  JobQueue(const ProfileCatalog &catalog, ProcessSupervisor &supervisor,
           EventBus &bus, QueueSettings settings);

  /// Cancels every job and joins every worker
  ~JobQueue();

  /// Disable copy
  JobQueue(const JobQueue &) = delete;
  JobQueue &operator=(const JobQueue &) = delete;

  /**
   * @brief Append a job to the Pending FIFO.
   *
   * @param source Source media file
   * @param destination Output file
   * @param profile_id Catalog id of the target profile
   * @param options Per-job switches
   * @return Id of the new job
   * @throws InvalidProfileError if profile_id is unknown
   * @throws DuplicateDestinationError if a Pending or Running job already
   *         writes destination
   */
  JobId enqueue(const std::string &source, const std::string &destination,
                const std::string &profile_id, JobOptions options = {});

  /// Same with an explicit profile (e.g. one not in the catalog)
  JobId enqueue(const std::string &source, const std::string &destination,
                ProfilePtr profile, JobOptions options = {});

  /**
   * @brief Cancel a job.
   * @note Pending: Canceled at once, no process is spawned. Running: the
   *       encoder is interrupted and this call blocks until the job is
   *       terminal.
   * @return false if the job is unknown or already terminal
   */
  bool cancel(JobId id);

  /// Cancel every Pending job, then every Running one; blocks until done
  void cancel_all();

  /**
   * @brief Drop a terminal job from the queue and the event bus.
   * @note Jobs are kept until forgotten; long-lived callers forget them once
   *       their final state has been read. The id is never reused.
   * @return false if the job is unknown or not yet terminal
   */
  bool forget(JobId id);

  /// Stop promoting Pending jobs; Running jobs continue
  void pause();

  /// Resume promotion
  void resume();

  bool paused() const;

  /// Snapshot of one job
  std::optional<Job> job(JobId id) const;

  /// Snapshots of every job in enqueue order
  std::vector<Job> jobs() const;

  std::size_t running_count() const;
  std::size_t pending_count() const;
  QueueTotals totals() const;

  /**
   * @brief Wait until nothing is Running and nothing can be promoted.
   * @return false on timeout
   * @note While paused, Pending jobs do not count.
   */
  bool wait_idle(std::chrono::milliseconds timeout);

  const QueueSettings &settings() const { return settings_; }

private:
  struct Slot {
    Job job;
    ProcessHandle *handle = nullptr; //< Non-null only while the encoder runs
    std::atomic<bool> cancel_requested{false}; //< Also read by the probe
    std::thread worker;
  };

  /// Publishes the handle of a running job for cancel(); clears it on scope
  /// exit, before the handle itself is destroyed
  class HandleRegistration {
  public:
    HandleRegistration(JobQueue &queue, JobId id, ProcessHandle &handle);
    ~HandleRegistration();

  private:
    JobQueue &queue_;
    JobId id_;
  };

  // **---- Scheduling (mutex_ held) ----**

  void schedule_locked();
  void join_finished_locked();
  void cancel_pending_locked(Slot &slot);
  void request_cancel_locked(Slot &slot);
  bool idle_locked() const;
  JobEvent make_event_locked(const Slot &slot, EventKind kind) const;

  // **---- Worker ----**

  void run_job(JobId id);
  void execute_job(JobId id);
  void publish_progress(JobId id, const ProgressEvent &event,
                        Clock::time_point started);
  bool cancel_requested(JobId id) const;

  /// Record the terminal state, publish it and schedule the next job
  void complete(JobId id, JobState state, JobOutcome outcome);

  const ProfileCatalog &catalog_;
  ProcessSupervisor &supervisor_;
  EventBus &bus_;
  QueueSettings settings_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::map<JobId, Slot> slots_; //< Every job ever enqueued, never erased
  std::deque<JobId> pending_;
  std::vector<JobId> finished_workers_; //< Workers ready to be joined
  std::size_t running_ = 0;
  JobId next_id_ = 1;
  bool paused_ = false;
  bool shutting_down_ = false;
};

} // namespace media_convert

#endif // MEDIA_CONVERT_JOB_QUEUE_HPP
