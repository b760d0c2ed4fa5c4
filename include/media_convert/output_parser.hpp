/**
 * @file output_parser.hpp
 * @brief Incremental parser for encoder console output
 *
 * @details The OutputParser turns raw stdout/stderr chunks of an encoder
 *          process into ProgressEvents and, once the process exits, into a
 *          StatusEvent. Recognizing individual lines is delegated to a
 *          LineRules strategy so the fragile, version-dependent text format
 *          stays isolated:
 *
 *          - FfmpegStatsRules: "Duration: ..." banner lines and the
 *            "frame=... time=... bitrate=... speed=..." statistics line
 *
 *          - FfmpegProgressRules: key=value blocks produced by
 *            "-progress pipe:1", closed by a "progress=" line
 *
 * @attention CHUNKING:
 *
 *   - Chunks may split lines anywhere; partial lines are buffered per stream
 *
 *   - '\n' and '\r' both end a line (ffmpeg redraws its statistics with
 *     '\r'); empty lines are skipped, so "\r\n" needs no special case
 *
 *   - The same byte stream yields the same events for any chunking
 */

#ifndef MEDIA_CONVERT_OUTPUT_PARSER_HPP
#define MEDIA_CONVERT_OUTPUT_PARSER_HPP

#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace media_convert {

/// Which pipe a chunk was read from
enum class OutputStream { StdOut = 0, StdErr = 1 };

/**
 * @struct LineResult
 * @brief Classification of one complete line.
 */
struct LineResult {
  enum class Kind {
    Ignored,   //< Not a recognized line
    Absorbed,  //< Recognized, contributes to a later event
    Duration,  //< Establishes the total media time
    Progress,  //< Produces a progress sample
    Malformed, //< Recognized, but a numeric field did not parse
  };

  Kind kind = Kind::Ignored;
  double duration = 0.0;
  double position = 0.0;
  double speed = 0.0;
  double bitrate_kbps = 0.0;
};

/**
 * @class LineRules
 * @brief Line recognition strategy used by OutputParser.
 * @note Implementations may keep state between lines (key=value blocks).
 *       One instance serves exactly one parser.
 */
class LineRules {
public:
  virtual ~LineRules() = default;

  virtual LineResult classify(std::string_view line, OutputStream stream) = 0;
};

/**
 * @class FfmpegStatsRules
 * @brief Human-readable ffmpeg output on stderr.
 */
class FfmpegStatsRules : public LineRules {
public:
  LineResult classify(std::string_view line, OutputStream stream) override;
};

/**
 * @class FfmpegProgressRules
 * @brief "-progress pipe:1" key=value blocks on stdout.
 * @note Duration banner lines on stderr are still recognized.
 */
class FfmpegProgressRules : public LineRules {
public:
  LineResult classify(std::string_view line, OutputStream stream) override;

private:
  bool have_time_ = false;
  bool time_malformed_ = false;
  double position_ = 0.0;
  double speed_ = 0.0;
  double bitrate_kbps_ = 0.0;
};

// **----- FIELD PARSERS -----**

/**
 * @brief Parse "[-]HH:MM:SS[.frac]" into seconds.
 * @return false if the text is not a timestamp (e.g. "N/A")
 */
bool parse_timestamp(std::string_view text, double &seconds);

/**
 * @brief Parse the leading decimal number of text ("1.5x", "128.0kbits/s").
 * @return false if text does not start with a number
 */
bool parse_leading_number(std::string_view text, double &value);

/**
 * @class OutputParser
 * @brief Stateful, incremental encoder output parser.
 *
 * @attention ROBUSTNESS:
 *
 * - Never throws on malformed output; bad lines are dropped and counted
 *
 * - Memory is bounded: partial lines are capped and only the last
 *   tail_lines diagnostic lines are kept
 *
 * - Reported positions never decrease
 */
class OutputParser {
public:
  /// Longest line kept before it is forcibly terminated
  static constexpr std::size_t kMaxLineLength = 64 * 1024;

  /**
   * @param rules Line strategy, FfmpegStatsRules when null
   * @param tail_lines Number of stderr lines kept for failure reports
   */
  explicit OutputParser(std::unique_ptr<LineRules> rules = nullptr,
                        std::size_t tail_lines = 20);

  /**
   * @brief Consume a chunk of raw output.
   * @return Progress events for every complete progress line in the chunk
   */
  std::vector<ProgressEvent> feed(std::string_view chunk,
                                  OutputStream stream = OutputStream::StdErr);

  /// Parse trailing unterminated lines, called once the process exited
  std::vector<ProgressEvent> flush();

  /**
   * @brief Map the exit code to a terminal status.
   * @note 0 = success; otherwise failure carrying the diagnostic tail.
   */
  StatusEvent finalize(int exit_code) const;

  /// Duration used when the output never reports one (e.g. probed)
  void set_fallback_duration(double seconds) { fallback_duration_ = seconds; }

  /// Established total, else fallback, else 0
  double duration() const;

  double position() const { return position_; }
  std::size_t parse_warning_count() const { return parse_warnings_; }
  const std::deque<std::string> &diagnostics() const { return tail_; }

private:
  void handle_line(std::string_view line, OutputStream stream,
                   std::vector<ProgressEvent> &events);
  void remember_diagnostic(std::string_view line);

  std::unique_ptr<LineRules> rules_;
  std::size_t tail_lines_;
  std::string partial_[2]; //< Indexed by OutputStream
  std::deque<std::string> tail_;

  bool duration_known_ = false;
  double duration_ = 0.0;
  double fallback_duration_ = 0.0;
  double position_ = 0.0;
  std::size_t parse_warnings_ = 0;
};

} // namespace media_convert

#endif // MEDIA_CONVERT_OUTPUT_PARSER_HPP
