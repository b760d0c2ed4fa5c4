/**
 * @file fake_encoder.hpp
 * @brief Scripted stand-in for ffmpeg used by the process and queue tests
 *
 * @details Writes an executable /bin/sh script into a private temp
 *          directory. The script accepts an ffmpeg-style command line and
 *          behaves according to the file name of the -i argument:
 *
 *          - "*hang*": prints a duration line, then sleeps silently
 *
 *          - "*fail*": prints diagnostics to stderr, exits 1
 *
 *          - "*partial*": writes the destination, then exits 1
 *
 *          - "*stubborn*": ignores SIGINT and prints progress forever
 *
 *          - "*stall*": reports 5 s of a 10 s duration, then sleeps
 *
 *          - "*nodur*": reports a position but never a duration, then sleeps
 *
 *          - "*slow*": 20 progress lines, 0.1 s apart, then success
 *
 *          - anything else: 4 progress lines, 0.1 s apart, then success
 *
 *          Every run first creates "<source>.started" so tests can prove a
 *          process was (or was not) spawned for a job, and
 *          "<source>.args" holding its arguments one per line. With "-progress" on
 *          the command line, progress goes to stdout as key=value blocks.
 */

#ifndef MEDIA_CONVERT_TESTS_FAKE_ENCODER_HPP
#define MEDIA_CONVERT_TESTS_FAKE_ENCODER_HPP

#include <string>
#include <vector>

#include "media_convert/config.hpp"

namespace media_convert {
namespace test {

class FakeEncoder {
public:
  FakeEncoder();
  ~FakeEncoder();

  FakeEncoder(const FakeEncoder &) = delete;
  FakeEncoder &operator=(const FakeEncoder &) = delete;

  /// Path of the executable script
  const std::string &path() const { return script_; }

  /// Private scratch directory, removed on destruction
  const std::string &dir() const { return dir_; }

  /// Create a small source file in dir() and return its path
  std::string make_source(const std::string &name) const;

  /// Path inside dir() without creating anything
  std::string file(const std::string &name) const;

  /// True if the script was started for this source
  bool started(const std::string &source) const;

  /// Arguments of the run for this source, empty if it never started
  std::vector<std::string> arguments(const std::string &source) const;

  /// Queue settings that run this script with short timeouts
  QueueSettings queue_settings(int max_concurrent_jobs = 1) const;

  /// Supervisor settings with short timeouts
  static SupervisorSettings fast_supervisor();

private:
  std::string dir_;
  std::string script_;
};

} // namespace test
} // namespace media_convert

#endif // MEDIA_CONVERT_TESTS_FAKE_ENCODER_HPP
