/**
 * @file logging.hpp
 * @brief Logging macros
 *
 * @details Provides compile-time controlled logging macros (LOG_INFO,
 *          LOG_WARN, LOG_ERROR, LOG_PHASE, LOG_SUCCESS) and a job-prefixed
 *          variant used by the scheduler and the process supervisor.
 *
 * @note All logs use fmt::print for type-safe formatting and are flushed
 *       immediately. Output from concurrent job threads is serialized by
 *       log_mutex so lines never interleave.
 */

#ifndef MEDIA_CONVERT_LOGGING_HPP
#define MEDIA_CONVERT_LOGGING_HPP

#include <cstdio>
#include <mutex>

#include <fmt/color.h>
#include <fmt/core.h>

namespace media_convert {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(media_convert::log_mutex);                \
    fmt::print("[INFO] " format_str "\n", ##__VA_ARGS__);                      \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(media_convert::log_mutex);                \
    fmt::print(fg(fmt::color::yellow), "[WARN] " format_str "\n",              \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(media_convert::log_mutex);                \
    fmt::print(fg(fmt::color::red), "[ERROR] " format_str "\n",                \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(media_convert::log_mutex);                \
    fmt::print(fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);          \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(media_convert::log_mutex);                \
    fmt::print(fg(fmt::color::green), format_str "\n", ##__VA_ARGS__);         \
    std::fflush(stdout);                                                       \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

/// Job-prefixed variants: LOG_JOB(INFO, id, "...", args)
#define LOG_JOB(level, job_id, format_str, ...)                                \
  LOG_##level("[Job {}] " format_str, job_id, ##__VA_ARGS__)

} // namespace media_convert

#endif // MEDIA_CONVERT_LOGGING_HPP
