/**
 * @file system.cpp
 * @brief System utilities implementation
 */

#include "media_convert/system.hpp"

#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>

#include <fmt/core.h>

namespace media_convert {

namespace {

/// Helper to read a number from a file
long read_long_from_file(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  long val;
  f >> val;
  return f ? val : -1;
}

/// Round a CFS quota up to whole CPUs, -1 when unlimited or unreadable
int cpus_from_quota(long quota, long period) {
  if (quota <= 0 || period <= 0)
    return -1;
  return static_cast<int>((quota + period - 1) / period);
}

} // anonymous namespace

// **---- CPU Detection ----**

int detect_cpu_limit() {
  int limit = -1;

  /// cgroup v2: "<quota|max> <period>"
  {
    std::ifstream f("/sys/fs/cgroup/cpu.max");
    std::string quota_str;
    long period = 0;
    if (f >> quota_str >> period && quota_str != "max") {
      try {
        limit = cpus_from_quota(std::stol(quota_str), period);
      } catch (const std::logic_error &) {
        limit = -1;
      }
    }
  }

  /// cgroup v1
  if (limit <= 0) {
    long quota = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
    long period = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
    limit = cpus_from_quota(quota, period);
  }

  if (limit <= 0)
    limit = static_cast<int>(std::thread::hardware_concurrency());

  return limit > 0 ? limit : 1;
}

int effective_concurrency(int configured) {
  return configured >= 1 ? configured : detect_cpu_limit();
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  if (seconds < 0)
    return "--:--:--";
  int total = static_cast<int>(seconds);
  int h = total / 3600;
  int m = (total % 3600) / 60;
  int s = total % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

} // namespace media_convert
