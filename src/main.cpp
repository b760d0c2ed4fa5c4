/**
 * @file main.cpp
 * @brief Entry point for the media_convert console front end
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Settings from the environment (see config/media_convert.env)
 *
 *          - Batch conversion with ConsoleRunner
 *
 * @note The exit code is the number of jobs that did not succeed, 1 on a
 *       usage or setup error.
 */

#include <cstdio>
#include <exception>
#include <string>

#include <fmt/core.h>

#include "media_convert/config.hpp"
#include "media_convert/console_runner.hpp"
#include "media_convert/errors.hpp"
#include "media_convert/logging.hpp"

using namespace media_convert;

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  ConsoleOptions options;
  std::string error;
  if (!parse_arguments(argc, argv, options, error)) {
    LOG_ERROR("{}", error);
    fmt::print("{}", usage_text(argc > 0 ? argv[0] : "media_convert"));
    return 1;
  }

  try {
    ConsoleRunner runner(options, QueueSettings::from_environment());
    return runner.run();
  } catch (const Error &e) {
    LOG_ERROR("{} ({})", e.what(), to_string(e.kind()));
  } catch (const std::exception &e) {
    LOG_ERROR("{}", e.what());
  }
  return 1;
}
