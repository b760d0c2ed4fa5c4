/**
 * @file profile.cpp
 * @brief Profile validation, built-in presets and command construction
 */

#include "media_convert/profile.hpp"

#include <algorithm>
#include <cstring>
#include <filesystem>

#include <fmt/core.h>

#include "media_convert/errors.hpp"

namespace media_convert {

namespace fs = std::filesystem;

namespace {

void require(bool condition, const ProfileSpec &spec, const char *what) {
  if (!condition) {
    throw InvalidProfileError(fmt::format(
        "Invalid profile '{}': {}", spec.id.empty() ? "<unnamed>" : spec.id,
        what));
  }
}

std::string backslash_escape(const std::string &text, const char *specials) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c != '\0' && std::strchr(specials, c))
      out.push_back('\\');
    out.push_back(c);
  }
  return out;
}

/// Escape a path for a filter option, then for the filtergraph around it
std::string escape_filter_value(const std::string &value) {
  return backslash_escape(backslash_escape(value, "\\':"), "\\'[],;");
}

} // anonymous namespace

// **---- ConversionProfile ----**

ProfilePtr ConversionProfile::create(ProfileSpec spec) {
  require(!spec.id.empty(), spec, "id is empty");
  require(!spec.container.empty(), spec, "target container is missing");
  require(!spec.video_codec.empty() || !spec.audio_codec.empty(), spec,
          "no codec set");

  if (spec.kind == MediaKind::AudioOnly) {
    require(spec.video_codec.empty(), spec,
            "audio-only profile sets a video codec");
    require(spec.crf < 0 && spec.video_bitrate_kbps == 0 &&
                spec.preset.empty(),
            spec, "audio-only profile sets video quality parameters");
  } else {
    require(!spec.video_codec.empty(), spec, "target video codec is missing");
  }

  require(!(spec.crf >= 0 && spec.video_bitrate_kbps > 0), spec,
          "both constant rate factor and video bitrate are set");
  require(spec.crf <= 63, spec, "constant rate factor out of range 0-63");
  require(spec.video_bitrate_kbps >= 0 && spec.audio_bitrate_kbps >= 0, spec,
          "bitrate is negative");
  require(spec.sample_rate == 0 ||
              (spec.sample_rate >= 8000 && spec.sample_rate <= 192000),
          spec, "sample rate out of range 8000-192000");
  require(spec.channels >= 0 && spec.channels <= 8, spec,
          "channel count out of range 1-8");
  if (spec.audio_codec.empty()) {
    require(spec.audio_bitrate_kbps == 0 && spec.sample_rate == 0 &&
                spec.channels == 0,
            spec, "audio parameters set without an audio codec");
  }

  if (spec.extension.empty())
    spec.extension = spec.container;
  if (spec.label.empty())
    spec.label = spec.id;

  return std::make_shared<const ConversionProfile>(Key(), std::move(spec));
}

// **---- Built-in presets ----**

std::vector<ProfileSpec> ProfileCatalog::builtin_presets() {
  std::vector<ProfileSpec> presets;

  auto video = [&presets](const char *id, const char *label,
                          const char *container, const char *ext,
                          const char *vcodec,
                          const char *acodec) -> ProfileSpec & {
    ProfileSpec p;
    p.id = id;
    p.label = label;
    p.container = container;
    p.extension = ext;
    p.kind = MediaKind::AudioVideo;
    p.video_codec = vcodec;
    p.audio_codec = acodec;
    presets.push_back(std::move(p));
    return presets.back();
  };

  auto audio = [&presets](const char *id, const char *label,
                          const char *container, const char *ext,
                          const char *acodec) -> ProfileSpec & {
    ProfileSpec p;
    p.id = id;
    p.label = label;
    p.container = container;
    p.extension = ext;
    p.kind = MediaKind::AudioOnly;
    p.audio_codec = acodec;
    presets.push_back(std::move(p));
    return presets.back();
  };

  {
    auto &p = video("mp4-h264", "MP4 (H.264 / AAC)", "mp4", "mp4", "libx264",
                    "aac");
    p.preset = "medium";
    p.crf = 23;
    p.audio_bitrate_kbps = 128;
    p.extra_flags = {"-pix_fmt", "yuv420p", "-movflags", "+faststart"};
  }
  {
    auto &p = video("mp4-h265", "MP4 (H.265 / AAC)", "mp4", "mp4", "libx265",
                    "aac");
    p.preset = "medium";
    p.crf = 28;
    p.audio_bitrate_kbps = 128;
    p.extra_flags = {"-tag:v", "hvc1", "-movflags", "+faststart"};
  }
  {
    auto &p = video("mkv-h264", "Matroska (H.264 / AAC)", "matroska", "mkv",
                    "libx264", "aac");
    p.preset = "medium";
    p.crf = 21;
    p.audio_bitrate_kbps = 160;
  }
  {
    auto &p = video("webm-vp9", "WebM (VP9 / Opus)", "webm", "webm",
                    "libvpx-vp9", "libopus");
    p.crf = 31;
    p.audio_bitrate_kbps = 128;
    p.extra_flags = {"-b:v", "0", "-row-mt", "1"};
  }
  {
    auto &p = video("mov-prores", "QuickTime (ProRes 422 / PCM)", "mov", "mov",
                    "prores_ks", "pcm_s16le");
    p.extra_flags = {"-profile:v", "2"};
  }
  {
    auto &p = video("avi-mpeg4", "AVI (MPEG-4 / MP3)", "avi", "avi", "mpeg4",
                    "libmp3lame");
    p.video_bitrate_kbps = 2000;
    p.audio_bitrate_kbps = 192;
  }
  {
    auto &p = audio("mp3", "MP3 Audio", "mp3", "mp3", "libmp3lame");
    p.audio_bitrate_kbps = 192;
  }
  {
    auto &p = audio("aac", "AAC Audio (M4A)", "ipod", "m4a", "aac");
    p.audio_bitrate_kbps = 192;
  }
  {
    auto &p = audio("ogg-vorbis", "Ogg Vorbis Audio", "ogg", "ogg",
                    "libvorbis");
    p.audio_bitrate_kbps = 160;
  }
  audio("flac", "FLAC Lossless Audio", "flac", "flac", "flac");
  {
    auto &p = audio("opus", "Opus Audio", "opus", "opus", "libopus");
    p.audio_bitrate_kbps = 128;
  }

  return presets;
}

void ProfileCatalog::add_builtin_presets() {
  for (auto &spec : builtin_presets()) {
    add(std::move(spec));
  }
}

// **---- Rendering ----**

ArgumentList ProfileCatalog::resolve(const ConversionProfile &profile) {
  const ProfileSpec &s = profile.spec();
  ArgumentList args;

  if (s.kind == MediaKind::AudioOnly) {
    args.push_back("-vn");
  } else {
    args.insert(args.end(), {"-c:v", s.video_codec});
    if (!s.preset.empty())
      args.insert(args.end(), {"-preset", s.preset});
    if (s.crf >= 0)
      args.insert(args.end(), {"-crf", std::to_string(s.crf)});
    if (s.video_bitrate_kbps > 0)
      args.insert(args.end(),
                  {"-b:v", fmt::format("{}k", s.video_bitrate_kbps)});
  }

  if (!s.audio_codec.empty()) {
    args.insert(args.end(), {"-c:a", s.audio_codec});
    if (s.audio_bitrate_kbps > 0)
      args.insert(args.end(),
                  {"-b:a", fmt::format("{}k", s.audio_bitrate_kbps)});
    if (s.sample_rate > 0)
      args.insert(args.end(), {"-ar", std::to_string(s.sample_rate)});
    if (s.channels > 0)
      args.insert(args.end(), {"-ac", std::to_string(s.channels)});
  } else {
    args.push_back("-an");
  }

  args.insert(args.end(), s.extra_flags.begin(), s.extra_flags.end());
  args.insert(args.end(), {"-f", s.container});
  return args;
}

// **---- Registry ----**

void ProfileCatalog::add(ProfilePtr profile) {
  if (!profile)
    throw InvalidProfileError("Cannot register a null profile");

  std::lock_guard<std::mutex> lock(mutex_);
  if (profiles_.count(profile->id())) {
    throw InvalidProfileError(
        fmt::format("Profile '{}' is already registered", profile->id()));
  }
  order_.push_back(profile->id());
  profiles_.emplace(profile->id(), std::move(profile));
}

ProfilePtr ProfileCatalog::add(ProfileSpec spec) {
  auto profile = ConversionProfile::create(std::move(spec));
  add(profile);
  return profile;
}

ProfilePtr ProfileCatalog::find(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = profiles_.find(id);
  return it == profiles_.end() ? nullptr : it->second;
}

ProfilePtr ProfileCatalog::get(const std::string &id) const {
  auto profile = find(id);
  if (!profile)
    throw InvalidProfileError(fmt::format("Unknown profile '{}'", id));
  return profile;
}

ProfilePtr
ProfileCatalog::customize(const std::string &base_id,
                          const std::function<void(ProfileSpec &)> &edit) {
  ProfileSpec spec = get(base_id)->spec();
  edit(spec);
  if (spec.id == base_id) {
    throw InvalidProfileError(
        fmt::format("Customized profile must not reuse the id '{}'", base_id));
  }
  return add(std::move(spec));
}

std::vector<std::string> ProfileCatalog::ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return order_;
}

std::vector<ProfilePtr> ProfileCatalog::profiles() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ProfilePtr> out;
  out.reserve(order_.size());
  for (const auto &id : order_) {
    out.push_back(profiles_.at(id));
  }
  return out;
}

std::size_t ProfileCatalog::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return profiles_.size();
}

// **---- Commands ----**

ArgumentList EncoderCommand::build(const ConversionProfile &profile,
                                   const std::string &source,
                                   const std::string &destination,
                                   const CommandOptions &options) {
  /// -nostdin: the encoder must never wait on our stdin
  ArgumentList args{"-hide_banner", "-nostdin"};
  if (options.progress_pipe)
    args.insert(args.end(), {"-progress", "pipe:1", "-nostats"});
  args.push_back(options.overwrite ? "-y" : "-n");
  args.insert(args.end(), {"-i", source});

  ArgumentList rendered = ProfileCatalog::resolve(profile);
  args.insert(args.end(), rendered.begin(), rendered.end());

  if (!options.subtitle_path.empty() &&
      profile.kind() == MediaKind::AudioVideo) {
    args.insert(args.end(), {"-vf", "subtitles=" + escape_filter_value(
                                              options.subtitle_path)});
  }

  args.push_back(destination);
  return args;
}

std::string output_path_for(const std::string &source,
                            const std::string &output_dir,
                            const ConversionProfile &profile, bool tagged) {
  std::string name = fs::path(source).stem().string();
  if (tagged)
    name = fmt::format("[{}]-{}", profile.id(), name);
  name += "." + profile.extension();
  return (fs::path(output_dir) / name).string();
}

} // namespace media_convert
