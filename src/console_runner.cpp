/**
 * @file console_runner.cpp
 * @brief Command-line batch conversion
 */

#include "media_convert/console_runner.hpp"

#include <signal.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <set>

#include <fmt/color.h>
#include <fmt/core.h>

#include "media_convert/errors.hpp"
#include "media_convert/event_bus.hpp"
#include "media_convert/logging.hpp"
#include "media_convert/process.hpp"
#include "media_convert/system.hpp"

namespace media_convert {

namespace fs = std::filesystem;

namespace {

/// Set by the SIGINT handler, polled by run()
std::atomic<bool> g_interrupted{false};

void on_interrupt(int) { g_interrupted.store(true); }

/// Seconds between queue-wide progress lines
constexpr double TOTALS_INTERVAL_SEC = 5.0;

bool parse_int(const char *text, int &value) {
  char *end = nullptr;
  long parsed = std::strtol(text, &end, 10);
  if (end == text || *end != '\0' || parsed < 0 || parsed > 1024)
    return false;
  value = static_cast<int>(parsed);
  return true;
}

} // anonymous namespace

// **---- COMMAND LINE ----**

bool parse_arguments(int argc, const char *const argv[],
                     ConsoleOptions &options, std::string &error) {
  std::vector<std::string> positional;
  bool options_done = false;

  for (int i = 1; i < argc; ++i) {
    const char *arg = argv[i];
    if (options_done || arg[0] != '-' || std::strcmp(arg, "-") == 0) {
      positional.emplace_back(arg);
    } else if (std::strcmp(arg, "--") == 0) {
      options_done = true;
    } else if (std::strcmp(arg, "--list-profiles") == 0) {
      options.list_profiles = true;
    } else if (std::strcmp(arg, "--tag") == 0) {
      options.tag = true;
    } else if (std::strcmp(arg, "--delete-source") == 0) {
      options.delete_source = true;
    } else if (std::strcmp(arg, "--overwrite") == 0) {
      options.overwrite = true;
    } else if (std::strcmp(arg, "--subtitles") == 0) {
      options.subtitles = true;
    } else if (std::strcmp(arg, "--jobs") == 0 || std::strcmp(arg, "-j") == 0) {
      if (i + 1 >= argc || !parse_int(argv[i + 1], options.jobs)) {
        error = fmt::format("{} expects a number 0-1024", arg);
        return false;
      }
      ++i;
    } else {
      error = fmt::format("Unknown option {}", arg);
      return false;
    }
  }

  if (options.list_profiles)
    return true;

  if (positional.size() < 3) {
    error = "Expected <profile-id> <output-dir> <input>...";
    return false;
  }
  options.profile_id = positional[0];
  options.output_dir = positional[1];
  options.inputs.assign(positional.begin() + 2, positional.end());
  return true;
}

std::string usage_text(const std::string &program) {
  return fmt::format(
      "Usage: {} [options] <profile-id> <output-dir> <input>...\n"
      "  --list-profiles   Print the built-in profiles and exit\n"
      "  --tag             Prefix output names with [<profile-id>]-\n"
      "  --delete-source   Delete each source after a successful conversion\n"
      "  --overwrite       Replace existing outputs\n"
      "  --subtitles       Insert <name>.srt from the source directory\n"
      "  --jobs N, -j N    Concurrent conversions (0 = one per CPU)\n",
      program);
}

bool is_media_file(const std::string &path) {
  static const std::set<std::string> extensions = {
      ".mp4", ".mkv", ".ts",  ".mov", ".avi", ".webm", ".flv",
      ".wmv", ".mpg", ".mpeg", ".m4v", ".3gp", ".ogv", ".vob",
      ".mp3", ".wav", ".flac", ".ogg", ".oga", ".m4a", ".aac",
      ".opus", ".wma"};

  std::string ext = fs::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return extensions.count(ext) > 0;
}

std::vector<std::string>
collect_media_files(const std::vector<std::string> &inputs) {
  std::vector<std::string> files;
  for (const auto &input : inputs) {
    std::error_code ec;
    if (fs::is_directory(input, ec)) {
      for (const auto &entry : fs::directory_iterator(input, ec)) {
        if (entry.is_regular_file() && is_media_file(entry.path().string()))
          files.push_back(entry.path().string());
      }
      if (ec)
        LOG_WARN("Cannot list {}: {}", input, ec.message());
    } else {
      /// Explicit files are taken as given; a missing one fails its job
      files.push_back(input);
    }
  }
  std::sort(files.begin(), files.end());
  files.erase(std::unique(files.begin(), files.end()), files.end());
  return files;
}

// **---- ConsoleRunner ----**

ConsoleRunner::ConsoleRunner(ConsoleOptions options, QueueSettings settings)
    : options_(std::move(options)), settings_(std::move(settings)) {
  if (options_.jobs >= 0)
    settings_.max_concurrent_jobs = effective_concurrency(options_.jobs);
  if (options_.overwrite)
    settings_.overwrite_output = true;
}

int ConsoleRunner::run() {
  ProfileCatalog catalog;
  catalog.add_builtin_presets();

  if (options_.list_profiles) {
    print_profiles(catalog);
    return 0;
  }

  ProfilePtr profile = catalog.get(options_.profile_id);

  std::vector<std::string> files = collect_media_files(options_.inputs);
  if (files.empty()) {
    LOG_WARN("No media files found");
    return 0;
  }

  if (!fs::exists(options_.output_dir))
    fs::create_directories(options_.output_dir);

  LOG_PHASE("================== MEDIA CONVERT ==================");
  LOG_INFO("Profile: {} ({})", profile->id(), profile->label());
  LOG_INFO("Output directory: {}", options_.output_dir);
  LOG_INFO("Files: {}", files.size());
  LOG_INFO("Concurrent jobs: {}", settings_.max_concurrent_jobs);
  LOG_INFO("Encoder: {}", settings_.encoder_path);
  LOG_PHASE("===================================================");

  EventBus bus(static_cast<std::size_t>(
      std::max(1, Config::event_queue_capacity())));
  ProcessSupervisor supervisor(settings_.supervisor);
  SubscriptionId subscription =
      bus.subscribe([this](const JobEvent &event) { on_event(event); });

  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = on_interrupt;
  sigemptyset(&sa.sa_mask);
  struct sigaction previous;
  ::sigaction(SIGINT, &sa, &previous);
  g_interrupted.store(false);

  auto batch_start = Clock::now();
  std::size_t skipped = 0;
  std::vector<Job> jobs;
  {
    JobQueue queue(catalog, supervisor, bus, settings_);

    JobOptions job_options;
    job_options.delete_source_on_success = options_.delete_source;
    job_options.insert_subtitles = options_.subtitles;

    for (const auto &file : files) {
      std::string destination =
          output_path_for(file, options_.output_dir, *profile, options_.tag);
      if (!settings_.overwrite_output && fs::exists(destination)) {
        LOG_INFO("Skipping existing output: {}", destination);
        ++skipped;
        continue;
      }
      try {
        queue.enqueue(file, destination, profile, job_options);
      } catch (const DuplicateDestinationError &e) {
        LOG_WARN("Skipping {}: {}", file, e.what());
        ++skipped;
      }
    }

    auto last_report = Clock::now();
    bool canceled = false;
    while (!queue.wait_idle(std::chrono::milliseconds(250))) {
      if (g_interrupted.load() && !canceled) {
        LOG_WARN("Interrupted, canceling all jobs");
        canceled = true;
        queue.cancel_all();
      }
      if (std::chrono::duration<double>(Clock::now() - last_report).count() >=
          TOTALS_INTERVAL_SEC) {
        last_report = Clock::now();
        QueueTotals t = queue.totals();
        LOG_PHASE("Overall {:.1f}% | running {} | pending {} | done {}",
                  t.overall_percent, t.running, t.pending,
                  t.succeeded + t.failed + t.canceled);
      }
    }
    jobs = queue.jobs();
  }

  ::sigaction(SIGINT, &previous, nullptr);
  bus.unsubscribe(subscription);

  double elapsed =
      std::chrono::duration<double>(Clock::now() - batch_start).count();
  print_summary(jobs, skipped, elapsed);

  long failures = std::count_if(jobs.begin(), jobs.end(), [](const Job &j) {
    return j.state != JobState::Succeeded;
  });
  return static_cast<int>(std::min(failures, 255L));
}

void ConsoleRunner::print_profiles(const ProfileCatalog &catalog) const {
  fmt::print(fg(fmt::color::cyan), "{:<14} {:<10} {:<6} {}\n", "ID",
             "CONTAINER", "EXT", "DESCRIPTION");
  for (const auto &profile : catalog.profiles()) {
    fmt::print("{:<14} {:<10} {:<6} {}\n", profile->id(),
               profile->container(), profile->extension(), profile->label());
  }
}

void ConsoleRunner::on_event(const JobEvent &event) {
  if (event.kind != EventKind::Progress) {
    reported_step_.erase(event.job_id);
    return;
  }

  const Progress &p = event.progress;
  int step = static_cast<int>(p.percent / 10.0);
  auto it = reported_step_.find(event.job_id);
  if (it != reported_step_.end() && it->second >= step)
    return;
  reported_step_[event.job_id] = step;

  LOG_JOB(INFO, event.job_id,
          "{:5.1f}% | {} / {} | {:.2f}x | {:.0f} kbit/s | ETA {}", p.percent,
          format_time(p.position), format_time(p.duration), p.average_speed,
          p.bitrate_kbps, format_time(p.remaining_sec));
}

void ConsoleRunner::print_summary(const std::vector<Job> &jobs,
                                  std::size_t skipped,
                                  double wall_clock_sec) const {
  int success = 0;
  int failed = 0;
  int canceled = 0;
  double media_sec = 0.0;

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================ CONVERSION SUMMARY ================\n");
  for (const auto &job : jobs) {
    std::string name = fs::path(job.source).filename().string();
    double took =
        std::chrono::duration<double>(job.finished_at - job.started_at)
            .count();
    switch (job.state) {
    case JobState::Succeeded:
      ++success;
      media_sec += job.progress.duration;
      fmt::print(fg(fmt::color::green), "{:<10} {:<30} {:>10}\n", "OK", name,
                 format_time(took));
      break;
    case JobState::Canceled:
      ++canceled;
      fmt::print(fg(fmt::color::yellow), "{:<10} {:<30} {}\n", "CANCELED",
                 name, job.outcome.reason);
      break;
    default:
      ++failed;
      fmt::print(fg(fmt::color::red), "{:<10} {:<30} {}\n", "FAILED", name,
                 job.outcome.reason);
      break;
    }
  }
  fmt::print(fg(fmt::color::cyan),
             "----------------------------------------------------\n");
  fmt::print("{:<25} {:>25}\n", "Total jobs:", jobs.size());
  fmt::print("{:<25} {:>25}\n", "Successful:", success);
  fmt::print("{:<25} {:>25}\n", "Failed:", failed);
  fmt::print("{:<25} {:>25}\n", "Canceled:", canceled);
  fmt::print("{:<25} {:>25}\n", "Skipped:", skipped);
  fmt::print("{:<25} {:>25}\n", "Concurrent jobs:",
             settings_.max_concurrent_jobs);
  fmt::print("{:<25} {:>22.1f}s\n", "Wall-clock time:", wall_clock_sec);
  if (wall_clock_sec > 0.0 && media_sec > 0.0) {
    fmt::print("{:<25} {:>22.2f}x\n", "Realtime factor:",
               media_sec / wall_clock_sec);
  }
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
}

} // namespace media_convert
