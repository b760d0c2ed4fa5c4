#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <thread>
#include <vector>

#include "fake_encoder.hpp"
#include "media_convert/errors.hpp"
#include "media_convert/event_bus.hpp"
#include "media_convert/job_queue.hpp"
#include "media_convert/process.hpp"
#include "media_convert/profile.hpp"

using namespace media_convert;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace {

/// Poll until pred holds or the deadline passes
bool eventually(const std::function<bool()> &pred,
                std::chrono::milliseconds timeout = 5000ms) {
  auto deadline = Clock::now() + timeout;
  while (Clock::now() < deadline) {
    if (pred())
      return true;
    std::this_thread::sleep_for(10ms);
  }
  return pred();
}

class JobQueueTest : public ::testing::Test {
protected:
  JobQueueTest() : bus_(100000), channel_(bus_.open_channel()) {
    catalog_.add_builtin_presets();
  }

  std::unique_ptr<JobQueue> make_queue(const QueueSettings &settings) {
    supervisor_ = std::make_unique<ProcessSupervisor>(settings.supervisor);
    return std::make_unique<JobQueue>(catalog_, *supervisor_, bus_, settings);
  }

  /// Everything published so far, in delivery order
  std::vector<JobEvent> drain() {
    JobEvent e;
    while (channel_->try_pop(e))
      events_.push_back(e);
    return events_;
  }

  std::vector<JobEvent> events_of(JobId id) {
    std::vector<JobEvent> result;
    for (const auto &e : drain()) {
      if (e.job_id == id)
        result.push_back(e);
    }
    return result;
  }

  test::FakeEncoder encoder_;
  ProfileCatalog catalog_;
  EventBus bus_;
  std::shared_ptr<EventChannel> channel_;
  std::unique_ptr<ProcessSupervisor> supervisor_;
  std::vector<JobEvent> events_;
};

} // namespace

// **---- Scheduling ----**

TEST_F(JobQueueTest, SingleSlotRunsJobsInFifoOrder) {
  auto queue = make_queue(encoder_.queue_settings(1));

  std::string a_src = encoder_.make_source("in.mov");
  std::string b_src = encoder_.make_source("second.mov");
  JobId a = queue->enqueue(a_src, encoder_.file("out.mp4"), "mp4-h264");
  JobId b = queue->enqueue(b_src, encoder_.file("second.mp4"), "mp4-h264");

  EXPECT_EQ(queue->job(a)->state, JobState::Running);
  EXPECT_EQ(queue->job(b)->state, JobState::Pending);
  EXPECT_EQ(queue->running_count(), 1u);
  EXPECT_EQ(queue->pending_count(), 1u);

  ASSERT_TRUE(queue->wait_idle(10000ms));
  EXPECT_EQ(queue->job(a)->state, JobState::Succeeded);
  EXPECT_EQ(queue->job(b)->state, JobState::Succeeded);
  EXPECT_TRUE(fs::exists(encoder_.file("out.mp4")));

  auto all = drain();
  auto a_done = std::find_if(all.begin(), all.end(), [a](const JobEvent &e) {
    return e.job_id == a && e.is_terminal();
  });
  auto b_started = std::find_if(all.begin(), all.end(), [b](const JobEvent &e) {
    return e.job_id == b && e.kind == EventKind::Started;
  });
  ASSERT_NE(a_done, all.end());
  ASSERT_NE(b_started, all.end());
  EXPECT_LT(a_done - all.begin(), b_started - all.begin());
}

TEST_F(JobQueueTest, NeverRunsMoreThanTheLimit) {
  auto queue = make_queue(encoder_.queue_settings(2));

  std::vector<JobId> ids;
  for (int i = 0; i < 5; ++i) {
    std::string name = "clip" + std::to_string(i);
    ids.push_back(queue->enqueue(encoder_.make_source(name + ".mov"),
                                 encoder_.file(name + ".mp4"), "mp4-h264"));
    EXPECT_LE(queue->running_count(), 2u);
  }
  ASSERT_TRUE(queue->wait_idle(20000ms));

  int running = 0;
  int peak = 0;
  for (const auto &e : drain()) {
    if (e.kind == EventKind::Started)
      peak = std::max(peak, ++running);
    else if (e.is_terminal())
      --running;
  }
  EXPECT_EQ(peak, 2);
  EXPECT_EQ(running, 0);

  for (JobId id : ids)
    EXPECT_EQ(queue->job(id)->state, JobState::Succeeded);
}

TEST_F(JobQueueTest, PausedQueueDoesNotPromote) {
  auto queue = make_queue(encoder_.queue_settings(1));
  queue->pause();
  EXPECT_TRUE(queue->paused());

  std::string source = encoder_.make_source("clip.mov");
  JobId id = queue->enqueue(source, encoder_.file("clip.mp4"), "mp4-h264");
  EXPECT_TRUE(queue->wait_idle(200ms));
  EXPECT_EQ(queue->job(id)->state, JobState::Pending);
  EXPECT_FALSE(encoder_.started(source));

  queue->resume();
  ASSERT_TRUE(queue->wait_idle(10000ms));
  EXPECT_EQ(queue->job(id)->state, JobState::Succeeded);
}

// **---- Enqueue validation ----**

TEST_F(JobQueueTest, UnknownProfileIsRejected) {
  auto queue = make_queue(encoder_.queue_settings(1));
  EXPECT_THROW(queue->enqueue(encoder_.make_source("a.mov"),
                              encoder_.file("a.out"), "no-such-profile"),
               InvalidProfileError);
  EXPECT_THROW(queue->enqueue(encoder_.make_source("a.mov"),
                              encoder_.file("a.out"), ProfilePtr()),
               InvalidProfileError);
  EXPECT_TRUE(queue->jobs().empty());
}

TEST_F(JobQueueTest, DuplicateDestinationIsRejectedWhileActive) {
  auto queue = make_queue(encoder_.queue_settings(1));
  std::string destination = encoder_.file("out.mp4");

  JobId first = queue->enqueue(encoder_.make_source("slow.mov"), destination,
                               "mp4-h264");
  EXPECT_THROW(queue->enqueue(encoder_.make_source("other.mov"),
                              encoder_.file("sub/../out.mp4"), "mp4-h264"),
               DuplicateDestinationError);
  EXPECT_EQ(queue->jobs().size(), 1u);

  ASSERT_TRUE(queue->wait_idle(10000ms));
  EXPECT_EQ(queue->job(first)->state, JobState::Succeeded);

  JobId again = queue->enqueue(encoder_.make_source("other.mov"), destination,
                               "mp4-h264");
  EXPECT_NE(again, first);
}

TEST_F(JobQueueTest, AcceptsProfileOutsideCatalog) {
  auto queue = make_queue(encoder_.queue_settings(1));
  ProfileSpec spec;
  spec.id = "voice-memo";
  spec.container = "ogg";
  spec.kind = MediaKind::AudioOnly;
  spec.audio_codec = "libopus";
  spec.audio_bitrate_kbps = 32;

  JobId id = queue->enqueue(encoder_.make_source("memo.wav"),
                            encoder_.file("memo.ogg"),
                            ConversionProfile::create(spec));
  ASSERT_TRUE(queue->wait_idle(10000ms));
  EXPECT_EQ(queue->job(id)->state, JobState::Succeeded);
  EXPECT_EQ(queue->job(id)->profile->id(), "voice-memo");
}

// **---- Cancellation ----**

TEST_F(JobQueueTest, CancelPendingNeverSpawns) {
  auto queue = make_queue(encoder_.queue_settings(1));
  std::string running_src = encoder_.make_source("slow.mov");
  std::string pending_src = encoder_.make_source("waiting.mov");

  JobId running = queue->enqueue(running_src, encoder_.file("slow.mp4"),
                                 "mp4-h264");
  JobId pending = queue->enqueue(pending_src, encoder_.file("waiting.mp4"),
                                 "mp4-h264");

  EXPECT_TRUE(queue->cancel(pending));
  Job job = *queue->job(pending);
  EXPECT_EQ(job.state, JobState::Canceled);
  EXPECT_FALSE(job.outcome.reason.empty());
  EXPECT_FALSE(queue->cancel(pending));
  EXPECT_FALSE(queue->cancel(12345));

  ASSERT_TRUE(queue->wait_idle(10000ms));
  EXPECT_EQ(queue->job(running)->state, JobState::Succeeded);
  EXPECT_FALSE(encoder_.started(pending_src));

  auto events = events_of(pending);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].kind, EventKind::Canceled);
}

TEST_F(JobQueueTest, CancelRunningBlocksUntilCanceled) {
  auto queue = make_queue(encoder_.queue_settings(1));
  std::string source = encoder_.make_source("slow.mov");
  std::string destination = encoder_.file("slow.mp4");
  JobId id = queue->enqueue(source, destination, "mp4-h264");

  ASSERT_TRUE(eventually([&] { return encoder_.started(source); }));
  EXPECT_TRUE(queue->cancel(id));

  Job job = *queue->job(id);
  EXPECT_EQ(job.state, JobState::Canceled);
  EXPECT_EQ(job.outcome.error, ErrorKind::None);
  EXPECT_FALSE(fs::exists(destination));
  EXPECT_EQ(queue->running_count(), 0u);
  EXPECT_FALSE(queue->cancel(id));

  auto events = events_of(id);
  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.back().kind, EventKind::Canceled);
}

TEST_F(JobQueueTest, CancelEscalatesForStubbornEncoder) {
  auto queue = make_queue(encoder_.queue_settings(1));
  std::string source = encoder_.make_source("stubborn.mov");
  JobId id = queue->enqueue(source, encoder_.file("stubborn.mp4"), "mp4-h264");

  ASSERT_TRUE(eventually([&] { return encoder_.started(source); }));
  auto before = Clock::now();
  EXPECT_TRUE(queue->cancel(id));
  EXPECT_GE(Clock::now() - before,
            encoder_.queue_settings().supervisor.termination_grace_period);
  EXPECT_EQ(queue->job(id)->state, JobState::Canceled);
}

TEST_F(JobQueueTest, CancelAllCancelsPendingAndRunning) {
  auto queue = make_queue(encoder_.queue_settings(1));
  JobId a = queue->enqueue(encoder_.make_source("slow1.mov"),
                           encoder_.file("slow1.mp4"), "mp4-h264");
  JobId b = queue->enqueue(encoder_.make_source("slow2.mov"),
                           encoder_.file("slow2.mp4"), "mp4-h264");

  queue->cancel_all();
  EXPECT_EQ(queue->job(a)->state, JobState::Canceled);
  EXPECT_EQ(queue->job(b)->state, JobState::Canceled);
  EXPECT_TRUE(queue->wait_idle(1000ms));

  QueueTotals totals = queue->totals();
  EXPECT_EQ(totals.canceled, 2u);
  EXPECT_EQ(totals.overall_percent, 0.0);
}

TEST_F(JobQueueTest, DestructorCancelsRunningJobs) {
  std::string source = encoder_.make_source("slow.mov");
  JobId id = 0;
  {
    auto queue = make_queue(encoder_.queue_settings(1));
    id = queue->enqueue(source, encoder_.file("slow.mp4"), "mp4-h264");
    ASSERT_TRUE(eventually([&] { return encoder_.started(source); }));
  }
  auto events = events_of(id);
  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.front().kind, EventKind::Started);
  EXPECT_EQ(events.back().kind, EventKind::Canceled);
}

// **---- Failures ----**

TEST_F(JobQueueTest, HungEncoderFailsWithHangTimeout) {
  QueueSettings settings = encoder_.queue_settings(1);
  settings.supervisor.output_silence_timeout = 300ms;
  auto queue = make_queue(settings);

  JobId hung = queue->enqueue(encoder_.make_source("hang.mov"),
                              encoder_.file("hang.mp4"), "mp4-h264");
  JobId next = queue->enqueue(encoder_.make_source("after.mov"),
                              encoder_.file("after.mp4"), "mp4-h264");
  ASSERT_TRUE(queue->wait_idle(10000ms));

  Job job = *queue->job(hung);
  EXPECT_EQ(job.state, JobState::Failed);
  EXPECT_EQ(job.outcome.error, ErrorKind::HangTimeout);
  EXPECT_FALSE(job.outcome.reason.empty());
  EXPECT_EQ(queue->job(next)->state, JobState::Succeeded);
}

TEST_F(JobQueueTest, SpawnFailureFailsOnlyThatJob) {
  QueueSettings settings = encoder_.queue_settings(1);
  settings.encoder_path = encoder_.file("no-such-encoder");
  auto queue = make_queue(settings);

  JobId a = queue->enqueue(encoder_.make_source("a.mov"),
                           encoder_.file("a.mp4"), "mp4-h264");
  JobId b = queue->enqueue(encoder_.make_source("b.mov"),
                           encoder_.file("b.mp4"), "mp4-h264");
  ASSERT_TRUE(queue->wait_idle(5000ms));

  for (JobId id : {a, b}) {
    Job job = *queue->job(id);
    EXPECT_EQ(job.state, JobState::Failed);
    EXPECT_EQ(job.outcome.error, ErrorKind::Spawn);
  }
  EXPECT_EQ(queue->running_count(), 0u);
}

TEST_F(JobQueueTest, MissingSourceFailsWithoutSpawning) {
  auto queue = make_queue(encoder_.queue_settings(1));
  std::string source = encoder_.file("vanished.mov");
  JobId id = queue->enqueue(source, encoder_.file("vanished.mp4"), "mp4-h264");
  ASSERT_TRUE(queue->wait_idle(5000ms));

  Job job = *queue->job(id);
  EXPECT_EQ(job.state, JobState::Failed);
  EXPECT_EQ(job.outcome.error, ErrorKind::SourceMissing);
  EXPECT_FALSE(encoder_.started(source));
}

TEST_F(JobQueueTest, EncoderErrorKeepsDiagnostics) {
  auto queue = make_queue(encoder_.queue_settings(1));
  JobId id = queue->enqueue(encoder_.make_source("fail.mov"),
                            encoder_.file("fail.mp4"), "mp4-h264");
  ASSERT_TRUE(queue->wait_idle(5000ms));

  Job job = *queue->job(id);
  EXPECT_EQ(job.state, JobState::Failed);
  EXPECT_EQ(job.outcome.error, ErrorKind::ProcessFailed);
  EXPECT_EQ(job.outcome.exit_code, 1);
  EXPECT_NE(job.outcome.reason.find("Conversion failed!"), std::string::npos);
  ASSERT_FALSE(job.outcome.diagnostics.empty());
  EXPECT_EQ(job.outcome.diagnostics.back(), "Conversion failed!");

  auto events = events_of(id);
  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.back().kind, EventKind::Failed);
  EXPECT_EQ(events.back().error, ErrorKind::ProcessFailed);
}

TEST_F(JobQueueTest, PartialOutputIsRemovedOnFailure) {
  std::string destination = encoder_.file("partial.mp4");
  {
    auto queue = make_queue(encoder_.queue_settings(1));
    queue->enqueue(encoder_.make_source("partial.mov"), destination,
                   "mp4-h264");
    ASSERT_TRUE(queue->wait_idle(5000ms));
  }
  EXPECT_FALSE(fs::exists(destination));

  QueueSettings keep = encoder_.queue_settings(1);
  keep.remove_partial_output = false;
  {
    auto queue = make_queue(keep);
    queue->enqueue(encoder_.make_source("partial.mov"), destination,
                   "mp4-h264");
    ASSERT_TRUE(queue->wait_idle(5000ms));
  }
  EXPECT_TRUE(fs::exists(destination));
}

// **---- Success handling ----**

TEST_F(JobQueueTest, DeleteSourceOnlyAfterSuccess) {
  auto queue = make_queue(encoder_.queue_settings(1));
  JobOptions options;
  options.delete_source_on_success = true;

  std::string good = encoder_.make_source("good.mov");
  std::string bad = encoder_.make_source("fail.mov");
  queue->enqueue(good, encoder_.file("good.mp4"), "mp4-h264", options);
  queue->enqueue(bad, encoder_.file("bad.mp4"), "mp4-h264", options);
  ASSERT_TRUE(queue->wait_idle(10000ms));

  EXPECT_FALSE(fs::exists(good));
  EXPECT_TRUE(fs::exists(encoder_.file("good.mp4")));
  EXPECT_TRUE(fs::exists(bad));
}

TEST_F(JobQueueTest, ProgressEventsAreOrderedAndMonotonic) {
  auto queue = make_queue(encoder_.queue_settings(1));
  JobId id = queue->enqueue(encoder_.make_source("clip.mov"),
                            encoder_.file("clip.mp4"), "mp4-h264");
  ASSERT_TRUE(queue->wait_idle(5000ms));

  auto events = events_of(id);
  ASSERT_GE(events.size(), 3u);
  EXPECT_EQ(events.front().kind, EventKind::Started);
  EXPECT_EQ(events.back().kind, EventKind::Succeeded);

  double last_percent = 0.0;
  for (std::size_t i = 0; i < events.size(); ++i) {
    EXPECT_EQ(events[i].sequence, i + 1);
    if (events[i].kind == EventKind::Progress) {
      EXPECT_GE(events[i].progress.percent, last_percent);
      EXPECT_LE(events[i].progress.percent, 100.0);
      last_percent = events[i].progress.percent;
    }
  }
  EXPECT_GT(last_percent, 0.0);

  Job job = *queue->job(id);
  EXPECT_DOUBLE_EQ(job.progress.percent, 100.0);
  EXPECT_DOUBLE_EQ(job.progress.duration, 4.0);
  EXPECT_EQ(job.parse_warnings, 0u);
}

TEST_F(JobQueueTest, ProgressPipeMode) {
  QueueSettings settings = encoder_.queue_settings(1);
  settings.progress_pipe = true;
  auto queue = make_queue(settings);

  JobId id = queue->enqueue(encoder_.make_source("clip.mov"),
                            encoder_.file("clip.mp4"), "mp4-h264");
  ASSERT_TRUE(queue->wait_idle(5000ms));

  auto events = events_of(id);
  double last_position = 0.0;
  for (const auto &e : events) {
    if (e.kind == EventKind::Progress)
      last_position = e.progress.position;
  }
  EXPECT_DOUBLE_EQ(last_position, 4.0);
  EXPECT_EQ(queue->job(id)->state, JobState::Succeeded);
}

TEST_F(JobQueueTest, TotalsWeighByDurationMidRun) {
  QueueSettings settings = encoder_.queue_settings(2);
  settings.supervisor.output_silence_timeout = 10s;
  auto queue = make_queue(settings);

  JobId a = queue->enqueue(encoder_.make_source("a.mov"),
                           encoder_.file("a.mp4"), "mp4-h264");
  JobId stall = queue->enqueue(encoder_.make_source("stall.mov"),
                               encoder_.file("stall.mp4"), "mp4-h264");

  ASSERT_TRUE(eventually([&] {
    return queue->job(a)->state == JobState::Succeeded &&
           queue->job(stall)->progress.percent >= 50.0;
  }));

  /// a: 4 s done; stall: 5 of 10 s
  QueueTotals totals = queue->totals();
  EXPECT_EQ(totals.succeeded, 1u);
  EXPECT_EQ(totals.running, 1u);
  EXPECT_NEAR(totals.overall_percent, 9.0 / 14.0 * 100.0, 1e-6);

  queue->cancel_all();
  totals = queue->totals();
  EXPECT_EQ(totals.canceled, 1u);
  EXPECT_DOUBLE_EQ(totals.overall_percent, 100.0);
}

TEST_F(JobQueueTest, TotalsUseEqualWeightsWhenADurationIsUnknown) {
  QueueSettings settings = encoder_.queue_settings(3);
  settings.supervisor.output_silence_timeout = 10s;
  auto queue = make_queue(settings);

  JobId a = queue->enqueue(encoder_.make_source("a.mov"),
                           encoder_.file("a.mp4"), "mp4-h264");
  JobId stall = queue->enqueue(encoder_.make_source("stall.mov"),
                               encoder_.file("stall.mp4"), "mp4-h264");
  JobId nodur = queue->enqueue(encoder_.make_source("nodur.mov"),
                               encoder_.file("nodur.mp4"), "mp4-h264");

  ASSERT_TRUE(eventually([&] {
    return queue->job(a)->state == JobState::Succeeded &&
           queue->job(stall)->progress.percent >= 50.0 &&
           queue->job(nodur)->progress.position >= 2.0;
  }));

  /// (1 + 0.5 + 0) / 3
  Job unknown = *queue->job(nodur);
  EXPECT_DOUBLE_EQ(unknown.progress.duration, 0.0);
  EXPECT_NEAR(queue->totals().overall_percent, 50.0, 1e-6);

  queue->cancel_all();
}

// **---- Subtitles ----**

TEST_F(JobQueueTest, InsertsSiblingSubtitlesForVideoProfiles) {
  auto queue = make_queue(encoder_.queue_settings(1));
  std::string with = encoder_.make_source("talk.mov");
  std::string subtitles = encoder_.make_source("talk.srt");
  std::string without = encoder_.make_source("mute.mov");

  JobOptions options;
  options.insert_subtitles = true;
  queue->enqueue(with, encoder_.file("talk.mp4"), "mp4-h264", options);
  queue->enqueue(without, encoder_.file("mute.mp4"), "mp4-h264", options);
  ASSERT_TRUE(queue->wait_idle(5000ms));

  auto args = encoder_.arguments(with);
  auto vf = std::find(args.begin(), args.end(), "-vf");
  ASSERT_NE(vf, args.end());
  ASSERT_NE(vf + 1, args.end());
  EXPECT_EQ(*(vf + 1), "subtitles=" + subtitles);
  EXPECT_EQ(args.back(), encoder_.file("talk.mp4"));

  args = encoder_.arguments(without);
  ASSERT_FALSE(args.empty());
  EXPECT_EQ(std::find(args.begin(), args.end(), "-vf"), args.end());
}

TEST_F(JobQueueTest, SubtitlesIgnoredForAudioProfilesAndWhenOff) {
  auto queue = make_queue(encoder_.queue_settings(1));
  std::string song = encoder_.make_source("song.wav");
  encoder_.make_source("song.srt");
  std::string talk = encoder_.make_source("talk.mov");
  encoder_.make_source("talk.srt");

  JobOptions options;
  options.insert_subtitles = true;
  queue->enqueue(song, encoder_.file("song.mp3"), "mp3", options);
  queue->enqueue(talk, encoder_.file("talk.mp4"), "mp4-h264");
  ASSERT_TRUE(queue->wait_idle(5000ms));

  for (const auto &source : {song, talk}) {
    auto args = encoder_.arguments(source);
    ASSERT_FALSE(args.empty()) << source;
    EXPECT_EQ(std::find(args.begin(), args.end(), "-vf"), args.end())
        << source;
  }
}

// **---- Forget ----**

TEST_F(JobQueueTest, ForgetDropsOnlyTerminalJobs) {
  QueueSettings settings = encoder_.queue_settings(1);
  settings.supervisor.output_silence_timeout = 10s;
  auto queue = make_queue(settings);

  JobId done = queue->enqueue(encoder_.make_source("a.mov"),
                              encoder_.file("a.mp4"), "mp4-h264");
  ASSERT_TRUE(queue->wait_idle(5000ms));
  JobId running = queue->enqueue(encoder_.make_source("stall.mov"),
                                 encoder_.file("stall.mp4"), "mp4-h264");
  JobId pending = queue->enqueue(encoder_.make_source("b.mov"),
                                 encoder_.file("b.mp4"), "mp4-h264");
  ASSERT_TRUE(eventually(
      [&] { return queue->job(running)->state == JobState::Running; }));

  EXPECT_FALSE(queue->forget(running));
  EXPECT_FALSE(queue->forget(pending));
  EXPECT_FALSE(queue->forget(9999));

  EXPECT_TRUE(queue->forget(done));
  EXPECT_FALSE(queue->job(done).has_value());
  EXPECT_FALSE(queue->forget(done));
  EXPECT_EQ(queue->jobs().size(), 2u);
  EXPECT_EQ(queue->totals().succeeded, 0u);

  queue->cancel_all();
  EXPECT_TRUE(queue->forget(running));
  EXPECT_TRUE(queue->forget(pending));
  EXPECT_TRUE(queue->jobs().empty());
}
