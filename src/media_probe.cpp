/**
 * @file media_probe.cpp
 * @brief libavformat probe implementation
 */

#include "media_convert/media_probe.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/error.h>
}

#include <fmt/core.h>

#include "media_convert/errors.hpp"
#include "media_convert/types.hpp"

namespace media_convert {

namespace {

struct InterruptState {
  Clock::time_point deadline;
  const std::atomic<bool> *cancel = nullptr;

  bool canceled() const { return cancel && cancel->load(); }
  bool expired() const { return Clock::now() >= deadline; }
};

/// Checked by libavformat during blocking I/O; non-zero aborts the call
int should_interrupt(void *opaque) {
  auto *state = static_cast<const InterruptState *>(opaque);
  return state->canceled() || state->expired() ? 1 : 0;
}

std::string av_error_text(int code) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(code, buf, sizeof(buf));
  return buf;
}

/// Closes the format context on every exit path
struct FormatContextGuard {
  AVFormatContext *ctx = nullptr;

  ~FormatContextGuard() {
    if (ctx)
      avformat_close_input(&ctx);
  }
};

} // anonymous namespace

MediaInfo probe_media(const std::string &path,
                      std::chrono::milliseconds timeout,
                      const std::atomic<bool> *cancel) {
  InterruptState state;
  state.deadline = Clock::now() + timeout;
  state.cancel = cancel;

  /// Explains why libavformat gave up, if the callback made it
  auto check_interrupted = [&] {
    if (state.canceled())
      throw ProbeError(fmt::format("Probe of '{}' canceled", path));
    if (state.expired())
      throw ProbeError(fmt::format("Probe of '{}' timed out", path));
  };

  if (state.canceled())
    check_interrupted();

  FormatContextGuard guard;
  guard.ctx = avformat_alloc_context();
  if (!guard.ctx)
    throw ProbeError("Failed to allocate AVFormatContext");

  guard.ctx->interrupt_callback.callback = should_interrupt;
  guard.ctx->interrupt_callback.opaque = &state;

  /// On failure avformat_open_input frees the context and nulls the pointer
  int ret = avformat_open_input(&guard.ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    check_interrupted();
    throw ProbeError(
        fmt::format("Cannot open '{}': {}", path, av_error_text(ret)));
  }

  ret = avformat_find_stream_info(guard.ctx, nullptr);
  if (ret < 0) {
    check_interrupted();
    throw ProbeError(fmt::format("No stream info in '{}': {}", path,
                                 av_error_text(ret)));
  }

  MediaInfo info;
  if (guard.ctx->iformat && guard.ctx->iformat->name)
    info.format_name = guard.ctx->iformat->name;
  if (guard.ctx->duration != AV_NOPTS_VALUE && guard.ctx->duration > 0)
    info.duration = static_cast<double>(guard.ctx->duration) / AV_TIME_BASE;

  int video_idx =
      av_find_best_stream(guard.ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_idx >= 0) {
    info.has_video = true;
    info.video_codec =
        avcodec_get_name(guard.ctx->streams[video_idx]->codecpar->codec_id);
  }

  int audio_idx =
      av_find_best_stream(guard.ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
  if (audio_idx >= 0) {
    info.has_audio = true;
    info.audio_codec =
        avcodec_get_name(guard.ctx->streams[audio_idx]->codecpar->codec_id);
  }

  if (!info.has_video && !info.has_audio)
    throw ProbeError(fmt::format("'{}' has no audio or video stream", path));

  return info;
}

} // namespace media_convert
