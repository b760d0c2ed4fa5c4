/**
 * @file system.hpp
 * @brief System utilities: CPU detection and time formatting
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection, used when MAX_CONCURRENT_JOBS
 *            is 0 (auto)
 *
 *          - Time formatting utilities for progress and summaries
 */

#ifndef MEDIA_CONVERT_SYSTEM_HPP
#define MEDIA_CONVERT_SYSTEM_HPP

#include <string>

namespace media_convert {

// **---- CPU Detection ----**

/**
 * @brief Detect the number of CPUs available to this process.
 *
 * @note In containers std::thread::hardware_concurrency() returns the host's
 *       core count. This reads the cgroup v2 quota (`cpu.max`), then the v1
 *       quota (`cpu.cfs_quota_us` / `cpu.cfs_period_us`) and falls back to
 *       hardware_concurrency().
 *
 * @return Detected CPU limit, always >= 1
 */
int detect_cpu_limit();

/**
 * @brief Resolve a configured job concurrency to an effective one.
 * @param configured Configured value, 0 or negative = auto
 * @return configured when >= 1, otherwise detect_cpu_limit()
 */
int effective_concurrency(int configured);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds, negative values print as --:--:--
 */
std::string format_time(double seconds);

} // namespace media_convert

#endif // MEDIA_CONVERT_SYSTEM_HPP
