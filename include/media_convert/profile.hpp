/**
 * @file profile.hpp
 * @brief Conversion profiles and encoder command construction
 *
 * @details Provides:
 *          - ProfileSpec: editable description of a target format
 *
 *          - ConversionProfile: validated, immutable profile
 *
 *          - ProfileCatalog: named profiles and argument rendering
 *
 *          - EncoderCommand: full encoder command line for one job
 *
 * @note Profiles are validated once, in ConversionProfile::create. Anything
 *       holding a ConversionProfile can render it without error checks.
 */

#ifndef MEDIA_CONVERT_PROFILE_HPP
#define MEDIA_CONVERT_PROFILE_HPP

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "types.hpp"

namespace media_convert {

/**
 * @enum MediaKind
 * @brief Which streams a profile produces.
 */
enum class MediaKind { AudioVideo, AudioOnly };

/**
 * @struct ProfileSpec
 * @brief Raw profile fields, validated by ConversionProfile::create.
 * @note Zero / negative numeric fields and empty strings mean "not set".
 */
struct ProfileSpec {
  std::string id;        //< Catalog key, e.g. "mp4-h264"
  std::string label;     //< Human label
  std::string container; //< Encoder muxer name passed to -f
  std::string extension; //< Output file extension, defaults to container
  MediaKind kind = MediaKind::AudioVideo;
  std::string video_codec;
  std::string audio_codec;
  std::string preset;         //< Encoder speed preset
  int crf = -1;               //< Constant rate factor
  int video_bitrate_kbps = 0; //< Target video bitrate
  int audio_bitrate_kbps = 0;
  int sample_rate = 0;
  int channels = 0;
  ArgumentList extra_flags; //< Appended before the output format
};

/**
 * @class ConversionProfile
 * @brief Immutable, validated conversion profile.
 */
class ConversionProfile {
  /// Restricts construction to create()
  class Key {
    friend class ConversionProfile;
    Key() = default;
  };

public:
  ConversionProfile(Key, ProfileSpec spec) : spec_(std::move(spec)) {}

  /**
   * @brief Validate a spec and freeze it into a profile.
   * @throws InvalidProfileError when a required field is missing or two
   *         fields contradict each other
   */
  static std::shared_ptr<const ConversionProfile> create(ProfileSpec spec);

  const std::string &id() const { return spec_.id; }
  const std::string &label() const { return spec_.label; }
  const std::string &container() const { return spec_.container; }
  const std::string &extension() const { return spec_.extension; }
  MediaKind kind() const { return spec_.kind; }
  const ProfileSpec &spec() const { return spec_; }

private:
  ProfileSpec spec_;
};

using ProfilePtr = std::shared_ptr<const ConversionProfile>;

/**
 * @class ProfileCatalog
 * @brief Thread-safe registry of named profiles.
 */
class ProfileCatalog {
public:
  ProfileCatalog() = default;

  /// Register every built-in preset
  void add_builtin_presets();

  /// Specs of the built-in presets, in display order
  static std::vector<ProfileSpec> builtin_presets();

  /**
   * @brief Render the encoder options of a profile.
   * @note Deterministic: the same profile always yields the same list.
   */
  static ArgumentList resolve(const ConversionProfile &profile);

  /**
   * @brief Register a profile.
   * @throws InvalidProfileError if the id is already taken
   */
  void add(ProfilePtr profile);

  /// Validate and register a spec
  ProfilePtr add(ProfileSpec spec);

  /// Profile by id, nullptr if unknown
  ProfilePtr find(const std::string &id) const;

  /**
   * @brief Profile by id.
   * @throws InvalidProfileError if unknown
   */
  ProfilePtr get(const std::string &id) const;

  /**
   * @brief Derive a new profile from an existing one.
   *
   * @param base_id Profile to copy
   * @param edit Mutates the copied spec; must assign a new id
   * @return The registered derived profile
   * @throws InvalidProfileError if base_id is unknown, the id is unchanged
   *         or taken, or the edited spec does not validate
   */
  ProfilePtr customize(const std::string &base_id,
                       const std::function<void(ProfileSpec &)> &edit);

  std::vector<std::string> ids() const;
  std::vector<ProfilePtr> profiles() const;
  std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, ProfilePtr> profiles_;
  std::vector<std::string> order_; //< Insertion order for listing
};

/**
 * @struct CommandOptions
 * @brief Job-independent switches applied to every encoder command.
 */
struct CommandOptions {
  bool overwrite = false;     //< -y instead of -n
  bool progress_pipe = false; //< -progress pipe:1 -nostats
  std::string subtitle_path;  //< Rendered with the subtitles filter if set
};

/**
 * @class EncoderCommand
 * @brief Assembles the argument list for converting one file.
 */
class EncoderCommand {
public:
  /**
   * @brief Build "<globals> -i <source> <profile options> <destination>".
   * @note A subtitle path is ignored for audio-only profiles.
   */
  static ArgumentList build(const ConversionProfile &profile,
                            const std::string &source,
                            const std::string &destination,
                            const CommandOptions &options = {});
};

/**
 * @brief Destination path for a source converted with a profile.
 *
 * @param source Source file path
 * @param output_dir Directory receiving the output
 * @param profile Target profile (provides the extension)
 * @param tagged Prefix the file name with "[<profile id>]-"
 */
std::string output_path_for(const std::string &source,
                            const std::string &output_dir,
                            const ConversionProfile &profile,
                            bool tagged = false);

} // namespace media_convert

#endif // MEDIA_CONVERT_PROFILE_HPP
