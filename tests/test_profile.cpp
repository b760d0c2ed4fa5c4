#include <gtest/gtest.h>

#include <algorithm>
#include <type_traits>

#include "media_convert/errors.hpp"
#include "media_convert/profile.hpp"

using namespace media_convert;

namespace {

ProfileSpec valid_video_spec() {
  ProfileSpec spec;
  spec.id = "custom";
  spec.container = "mp4";
  spec.video_codec = "libx264";
  spec.audio_codec = "aac";
  return spec;
}

ProfileSpec valid_audio_spec() {
  ProfileSpec spec;
  spec.id = "voice";
  spec.container = "mp3";
  spec.kind = MediaKind::AudioOnly;
  spec.audio_codec = "libmp3lame";
  return spec;
}

} // namespace

// **---- Validation ----**

TEST(ConversionProfile, AcceptsMinimalSpecsAndFillsDefaults) {
  auto video = ConversionProfile::create(valid_video_spec());
  EXPECT_EQ(video->id(), "custom");
  EXPECT_EQ(video->label(), "custom");
  EXPECT_EQ(video->extension(), "mp4");

  auto audio = ConversionProfile::create(valid_audio_spec());
  EXPECT_EQ(audio->kind(), MediaKind::AudioOnly);
}

TEST(ConversionProfile, OnlyCreateCanConstruct) {
  EXPECT_FALSE((std::is_constructible<ConversionProfile, ProfileSpec>::value));
  EXPECT_FALSE(std::is_default_constructible<ConversionProfile>::value);
}

TEST(ConversionProfile, RejectsMissingTargetCodec) {
  ProfileSpec spec = valid_video_spec();
  spec.video_codec.clear();
  spec.audio_codec.clear();
  EXPECT_THROW(ConversionProfile::create(spec), InvalidProfileError);

  ProfileSpec video_only_missing = valid_video_spec();
  video_only_missing.video_codec.clear();
  EXPECT_THROW(ConversionProfile::create(video_only_missing),
               InvalidProfileError);
}

TEST(ConversionProfile, RejectsMissingIdOrContainer) {
  ProfileSpec no_id = valid_video_spec();
  no_id.id.clear();
  EXPECT_THROW(ConversionProfile::create(no_id), InvalidProfileError);

  ProfileSpec no_container = valid_video_spec();
  no_container.container.clear();
  EXPECT_THROW(ConversionProfile::create(no_container), InvalidProfileError);
}

TEST(ConversionProfile, RejectsAudioOnlyWithVideoSettings) {
  ProfileSpec with_codec = valid_audio_spec();
  with_codec.video_codec = "libx264";
  EXPECT_THROW(ConversionProfile::create(with_codec), InvalidProfileError);

  ProfileSpec with_crf = valid_audio_spec();
  with_crf.crf = 20;
  EXPECT_THROW(ConversionProfile::create(with_crf), InvalidProfileError);
}

TEST(ConversionProfile, RejectsContradictoryOrOutOfRangeQuality) {
  ProfileSpec both = valid_video_spec();
  both.crf = 23;
  both.video_bitrate_kbps = 2000;
  EXPECT_THROW(ConversionProfile::create(both), InvalidProfileError);

  ProfileSpec crf = valid_video_spec();
  crf.crf = 64;
  EXPECT_THROW(ConversionProfile::create(crf), InvalidProfileError);

  ProfileSpec bitrate = valid_video_spec();
  bitrate.audio_bitrate_kbps = -1;
  EXPECT_THROW(ConversionProfile::create(bitrate), InvalidProfileError);

  ProfileSpec rate = valid_video_spec();
  rate.sample_rate = 100;
  EXPECT_THROW(ConversionProfile::create(rate), InvalidProfileError);

  ProfileSpec channels = valid_video_spec();
  channels.channels = 9;
  EXPECT_THROW(ConversionProfile::create(channels), InvalidProfileError);
}

TEST(ConversionProfile, RejectsAudioParametersWithoutAudioCodec) {
  ProfileSpec spec = valid_video_spec();
  spec.audio_codec.clear();
  spec.audio_bitrate_kbps = 128;
  EXPECT_THROW(ConversionProfile::create(spec), InvalidProfileError);
}

TEST(ConversionProfile, ErrorCarriesKind) {
  ProfileSpec spec = valid_video_spec();
  spec.container.clear();
  try {
    ConversionProfile::create(spec);
    FAIL() << "expected InvalidProfileError";
  } catch (const Error &e) {
    EXPECT_EQ(e.kind(), ErrorKind::InvalidProfile);
    EXPECT_NE(std::string(e.what()).find("custom"), std::string::npos);
  }
}

// **---- Rendering ----**

TEST(ProfileCatalog, BuiltinPresetsAreValid) {
  ProfileCatalog catalog;
  catalog.add_builtin_presets();

  std::vector<std::string> expected = {
      "mp4-h264", "mp4-h265", "mkv-h264", "webm-vp9", "mov-prores", "avi-mpeg4",
      "mp3",      "aac",      "ogg-vorbis", "flac",   "opus"};
  EXPECT_EQ(catalog.ids(), expected);
  EXPECT_EQ(catalog.size(), expected.size());
}

TEST(ProfileCatalog, ResolveIsDeterministic) {
  ProfileCatalog catalog;
  catalog.add_builtin_presets();
  for (const auto &profile : catalog.profiles()) {
    EXPECT_EQ(ProfileCatalog::resolve(*profile),
              ProfileCatalog::resolve(*profile))
        << profile->id();
  }
}

TEST(ProfileCatalog, ResolveOrdersVideoAudioExtraFormat) {
  ProfileCatalog catalog;
  catalog.add_builtin_presets();

  ArgumentList expected = {"-c:v",      "libx264", "-preset", "medium",
                           "-crf",      "23",      "-c:a",    "aac",
                           "-b:a",      "128k",    "-pix_fmt", "yuv420p",
                           "-movflags", "+faststart", "-f",   "mp4"};
  EXPECT_EQ(ProfileCatalog::resolve(*catalog.get("mp4-h264")), expected);
}

TEST(ProfileCatalog, ResolveAudioOnlyDisablesVideo) {
  ProfileSpec spec = valid_audio_spec();
  spec.audio_bitrate_kbps = 96;
  spec.sample_rate = 44100;
  spec.channels = 1;
  auto profile = ConversionProfile::create(spec);

  ArgumentList expected = {"-vn", "-c:a", "libmp3lame", "-b:a", "96k",
                           "-ar", "44100", "-ac", "1", "-f", "mp3"};
  EXPECT_EQ(ProfileCatalog::resolve(*profile), expected);
}

TEST(ProfileCatalog, ResolveVideoOnlyDisablesAudio) {
  ProfileSpec spec = valid_video_spec();
  spec.audio_codec.clear();
  spec.video_bitrate_kbps = 1500;
  auto profile = ConversionProfile::create(spec);

  ArgumentList expected = {"-c:v", "libx264", "-b:v", "1500k",
                           "-an",  "-f",      "mp4"};
  EXPECT_EQ(ProfileCatalog::resolve(*profile), expected);
}

// **---- Registry ----**

TEST(ProfileCatalog, AddRejectsDuplicateId) {
  ProfileCatalog catalog;
  catalog.add(valid_video_spec());
  EXPECT_THROW(catalog.add(valid_video_spec()), InvalidProfileError);
  EXPECT_EQ(catalog.size(), 1u);
}

TEST(ProfileCatalog, GetUnknownThrowsFindReturnsNull) {
  ProfileCatalog catalog;
  EXPECT_EQ(catalog.find("nope"), nullptr);
  EXPECT_THROW(catalog.get("nope"), InvalidProfileError);
}

TEST(ProfileCatalog, CustomizeCopiesWithoutTouchingBase) {
  ProfileCatalog catalog;
  catalog.add_builtin_presets();
  auto base = catalog.get("mp4-h264");

  auto derived = catalog.customize("mp4-h264", [](ProfileSpec &spec) {
    spec.id = "mp4-h264-small";
    spec.crf = 30;
  });

  EXPECT_EQ(derived->spec().crf, 30);
  EXPECT_EQ(catalog.get("mp4-h264")->spec().crf, 23);
  EXPECT_EQ(catalog.get("mp4-h264"), base);
  EXPECT_EQ(catalog.get("mp4-h264-small"), derived);
}

TEST(ProfileCatalog, CustomizeRejectsSameIdAndInvalidEdits) {
  ProfileCatalog catalog;
  catalog.add_builtin_presets();
  std::size_t before = catalog.size();

  EXPECT_THROW(catalog.customize("mp4-h264", [](ProfileSpec &spec) {
    spec.crf = 18;
  }),
               InvalidProfileError);

  EXPECT_THROW(catalog.customize("mp3",
                                 [](ProfileSpec &spec) {
                                   spec.id = "mp3-video";
                                   spec.video_codec = "libx264";
                                 }),
               InvalidProfileError);

  EXPECT_THROW(catalog.customize("missing",
                                 [](ProfileSpec &spec) { spec.id = "x"; }),
               InvalidProfileError);

  EXPECT_EQ(catalog.size(), before);
}

// **---- Commands ----**

TEST(EncoderCommand, BuildPlacesInputBeforeOptionsAndOutputLast) {
  auto profile = ConversionProfile::create(valid_audio_spec());
  ArgumentList args = EncoderCommand::build(*profile, "in.wav", "out.mp3");

  ArgumentList expected = {"-hide_banner", "-nostdin", "-n",   "-i",
                           "in.wav",       "-vn",      "-c:a", "libmp3lame",
                           "-f",           "mp3",      "out.mp3"};
  EXPECT_EQ(args, expected);
}

TEST(EncoderCommand, BuildHonorsOverwriteAndProgressPipe) {
  auto profile = ConversionProfile::create(valid_audio_spec());
  CommandOptions options;
  options.overwrite = true;
  options.progress_pipe = true;
  ArgumentList args =
      EncoderCommand::build(*profile, "in.wav", "out.mp3", options);

  ASSERT_GE(args.size(), 7u);
  EXPECT_EQ(args[2], "-progress");
  EXPECT_EQ(args[3], "pipe:1");
  EXPECT_EQ(args[4], "-nostats");
  EXPECT_EQ(args[5], "-y");
  EXPECT_EQ(std::count(args.begin(), args.end(), "-n"), 0);
  EXPECT_EQ(args.back(), "out.mp3");
}

TEST(EncoderCommand, BuildAddsSubtitleFilterBeforeOutput) {
  ProfileCatalog catalog;
  catalog.add_builtin_presets();
  CommandOptions options;
  options.subtitle_path = "/media/talk.srt";

  ArgumentList args = EncoderCommand::build(
      *catalog.get("mp4-h264"), "/media/talk.mov", "/out/talk.mp4", options);
  ASSERT_GE(args.size(), 3u);
  EXPECT_EQ(args[args.size() - 3], "-vf");
  EXPECT_EQ(args[args.size() - 2], "subtitles=/media/talk.srt");
  EXPECT_EQ(args.back(), "/out/talk.mp4");
}

TEST(EncoderCommand, BuildEscapesSubtitlePathTwice) {
  ProfileCatalog catalog;
  catalog.add_builtin_presets();
  CommandOptions options;
  options.subtitle_path = "/m/it's:a,b.srt";

  ArgumentList args = EncoderCommand::build(*catalog.get("mp4-h264"),
                                            "/m/in.mov", "/out/in.mp4", options);
  auto vf = std::find(args.begin(), args.end(), "-vf");
  ASSERT_NE(vf, args.end());
  /// Option level: ' and :, then graph level: \ ' and ,
  EXPECT_EQ(*(vf + 1), "subtitles=/m/it\\\\\\'s\\\\:a\\,b.srt");
}

TEST(EncoderCommand, BuildIgnoresSubtitlesForAudioOnly) {
  auto profile = ConversionProfile::create(valid_audio_spec());
  CommandOptions options;
  options.subtitle_path = "/media/song.srt";

  ArgumentList args =
      EncoderCommand::build(*profile, "in.wav", "out.mp3", options);
  EXPECT_EQ(args, EncoderCommand::build(*profile, "in.wav", "out.mp3"));
}

TEST(OutputPath, UsesStemAndProfileExtension) {
  ProfileCatalog catalog;
  catalog.add_builtin_presets();
  auto mkv = catalog.get("mkv-h264");

  EXPECT_EQ(output_path_for("/videos/holiday.mov", "/out", *mkv),
            "/out/holiday.mkv");
  EXPECT_EQ(output_path_for("/videos/holiday.mov", "/out", *mkv, true),
            "/out/[mkv-h264]-holiday.mkv");
  EXPECT_EQ(output_path_for("clip.v2.avi", "out", *catalog.get("aac")),
            "out/clip.v2.m4a");
}
