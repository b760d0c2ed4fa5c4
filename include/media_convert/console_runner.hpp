/**
 * @file console_runner.hpp
 * @brief Command-line front end for batch conversion
 *
 * @details Converts a list of files (or directories of media files) with one
 *          profile:
 *
 *          - One job per input, destination derived from the profile
 *
 *          - Progress logged per job in 10% steps, plus periodic queue totals
 *
 *          - Ctrl-C cancels every job; partial outputs are removed
 *
 *          - A summary table is printed at the end
 *
 * @note Usage: media_convert [options] <profile-id> <output-dir> <input>...
 */

#ifndef MEDIA_CONVERT_CONSOLE_RUNNER_HPP
#define MEDIA_CONVERT_CONSOLE_RUNNER_HPP

#include <map>
#include <string>
#include <vector>

#include "config.hpp"
#include "job_queue.hpp"
#include "profile.hpp"
#include "types.hpp"

namespace media_convert {

/**
 * @struct ConsoleOptions
 * @brief Parsed command line.
 */
struct ConsoleOptions {
  std::string profile_id;
  std::string output_dir;
  std::vector<std::string> inputs; //< Files or directories
  bool list_profiles = false;      //< --list-profiles
  bool tag = false;                //< --tag: "[<profile>]-name.ext"
  bool delete_source = false;      //< --delete-source
  bool overwrite = false;          //< --overwrite
  bool subtitles = false;          //< --subtitles: burn in <stem>.srt
  int jobs = -1;                   //< --jobs N, -1 = MAX_CONCURRENT_JOBS
};

/**
 * @brief Parse argv.
 * @param error Set to a message when parsing fails
 * @return false on a usage error
 */
bool parse_arguments(int argc, const char *const argv[],
                     ConsoleOptions &options, std::string &error);

/// Usage text
std::string usage_text(const std::string &program);

/// True if the extension is a known audio or video container
bool is_media_file(const std::string &path);

/**
 * @brief Expand inputs into a sorted, de-duplicated list of files.
 * @note Directories contribute their media files (non-recursive); files
 *       named explicitly are always taken.
 */
std::vector<std::string>
collect_media_files(const std::vector<std::string> &inputs);

/**
 * @class ConsoleRunner
 * @brief Runs one batch from the command line.
 */
class ConsoleRunner {
public:
  ConsoleRunner(ConsoleOptions options, QueueSettings settings);

  /**
   * @brief Convert every input.
   * @return Number of jobs that did not succeed (capped at 255)
   * @throws InvalidProfileError for an unknown profile id
   */
  int run();

private:
  void print_profiles(const ProfileCatalog &catalog) const;
  void on_event(const JobEvent &event);
  void print_summary(const std::vector<Job> &jobs, std::size_t skipped,
                     double wall_clock_sec) const;

  ConsoleOptions options_;
  QueueSettings settings_;
  std::map<JobId, int> reported_step_; //< Delivery thread only
};

} // namespace media_convert

#endif // MEDIA_CONVERT_CONSOLE_RUNNER_HPP
