/**
 * @file media_probe.hpp
 * @brief In-process source inspection with libavformat
 *
 * @details Reads container duration and stream layout without spawning a
 *          prober process. The result provides the fallback total duration
 *          for progress when the encoder never prints one, and the weights
 *          for queue-wide progress.
 *
 * @attention DEADLINE:
 *
 *   - Demuxers can block indefinitely on damaged or unusual input. Every
 *     probe runs under a deadline enforced by the AVIO interrupt callback,
 *     so a wedged probe fails with ProbeError instead of stalling the job
 *
 *   - The same callback watches an optional cancel flag, so canceling a job
 *     never waits for the probe deadline
 */

#ifndef MEDIA_CONVERT_MEDIA_PROBE_HPP
#define MEDIA_CONVERT_MEDIA_PROBE_HPP

#include <atomic>
#include <chrono>
#include <string>

namespace media_convert {

/**
 * @struct MediaInfo
 * @brief What the probe learned about a source file.
 */
struct MediaInfo {
  double duration = 0.0;   //< Seconds, 0 if the container does not say
  std::string format_name; //< Demuxer short name, e.g. "mov,mp4,m4a,..."
  bool has_video = false;
  bool has_audio = false;
  std::string video_codec; //< Codec name of the best video stream
  std::string audio_codec; //< Codec name of the best audio stream
};

/**
 * @brief Probe a media file.
 *
 * @param path Source file
 * @param timeout Deadline for open + stream discovery
 * @param cancel Optional flag; once set, blocking I/O is aborted
 * @return Container and stream information
 * @throws ProbeError if the file cannot be opened, is not media, the
 *         deadline expires or the probe is canceled
 * @note Thread-safe; each call uses its own format context.
 */
MediaInfo probe_media(const std::string &path,
                      std::chrono::milliseconds timeout,
                      const std::atomic<bool> *cancel = nullptr);

} // namespace media_convert

#endif // MEDIA_CONVERT_MEDIA_PROBE_HPP
