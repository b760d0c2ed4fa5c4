/**
 * @file output_parser.cpp
 * @brief Encoder output parsing implementation
 */

#include "media_convert/output_parser.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>

#include <fmt/core.h>

namespace media_convert {

namespace {

constexpr std::string_view kWhitespace = " \t";

std::string_view trim(std::string_view text) {
  auto first = text.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos)
    return {};
  auto last = text.find_last_not_of(kWhitespace);
  return text.substr(first, last - first + 1);
}

bool starts_with(std::string_view text, std::string_view prefix) {
  return text.size() >= prefix.size() &&
         text.compare(0, prefix.size(), prefix) == 0;
}

/**
 * @brief Value of "key=value" inside a statistics line.
 * @note The value starts after optional spaces ("bitrate= 128.0kbits/s") and
 *       ends at the next space. Returns false if the key is absent.
 */
bool find_field(std::string_view line, std::string_view key,
                std::string_view &value) {
  std::size_t pos = 0;
  while ((pos = line.find(key, pos)) != std::string_view::npos) {
    /// Whole-key match only: "time=" must not match "out_time="
    if (pos == 0 || line[pos - 1] == ' ') {
      std::size_t begin = pos + key.size();
      while (begin < line.size() && line[begin] == ' ')
        ++begin;
      std::size_t end = line.find(' ', begin);
      if (end == std::string_view::npos)
        end = line.size();
      value = line.substr(begin, end - begin);
      return true;
    }
    pos += key.size();
  }
  return false;
}

/// "Duration: 00:01:02.50, start: ..." on stderr
bool classify_duration(std::string_view trimmed, LineResult &result) {
  constexpr std::string_view kDuration = "Duration:";
  if (!starts_with(trimmed, kDuration))
    return false;

  std::string_view value = trim(trimmed.substr(kDuration.size()));
  value = value.substr(0, value.find(','));

  double seconds = 0.0;
  if (!parse_timestamp(trim(value), seconds)) {
    result.kind = LineResult::Kind::Malformed;
  } else if (seconds > 0.0) {
    result.kind = LineResult::Kind::Duration;
    result.duration = seconds;
  } else {
    result.kind = LineResult::Kind::Absorbed;
  }
  return true;
}

double kbps_from_text(std::string_view text) {
  double value = 0.0;
  if (!parse_leading_number(text, value))
    return 0.0;
  if (text.find("mbits") != std::string_view::npos)
    value *= 1000.0;
  return value;
}

} // anonymous namespace

// **----- FIELD PARSERS -----**

bool parse_leading_number(std::string_view text, double &value) {
  if (text.empty() || text.size() > 64)
    return false;
  std::string copy(text);
  const char *begin = copy.c_str();
  char *end = nullptr;
  errno = 0;
  double parsed = std::strtod(begin, &end);
  if (end == begin || errno == ERANGE)
    return false;
  value = parsed;
  return true;
}

bool parse_timestamp(std::string_view text, double &seconds) {
  bool negative = false;
  if (!text.empty() && text.front() == '-') {
    negative = true;
    text.remove_prefix(1);
  }

  double parts[3] = {0.0, 0.0, 0.0};
  for (int i = 0; i < 3; ++i) {
    std::size_t colon = text.find(':');
    std::string_view piece = (i < 2) ? text.substr(0, colon) : text;
    if ((i < 2 && colon == std::string_view::npos) || piece.empty())
      return false;
    if (piece.find_first_not_of("0123456789.") != std::string_view::npos)
      return false;
    if (!parse_leading_number(piece, parts[i]))
      return false;
    if (i < 2)
      text.remove_prefix(colon + 1);
  }
  if (parts[1] >= 60.0 || parts[2] >= 60.0)
    return false;

  seconds = parts[0] * 3600.0 + parts[1] * 60.0 + parts[2];
  if (negative)
    seconds = -seconds;
  return true;
}

// **----- FfmpegStatsRules -----**

LineResult FfmpegStatsRules::classify(std::string_view line,
                                      OutputStream stream) {
  LineResult result;
  if (stream != OutputStream::StdErr)
    return result;

  std::string_view trimmed = trim(line);
  if (classify_duration(trimmed, result))
    return result;

  /// "frame=  240 fps= 60 q=28.0 size=  1024kB time=00:00:10.00
  ///  bitrate= 838.9kbits/s speed=2.5x" (audio-only output has no frame=)
  std::string_view time_text;
  std::string_view ignored;
  if (!find_field(trimmed, "time=", time_text) ||
      !(find_field(trimmed, "frame=", ignored) ||
        find_field(trimmed, "size=", ignored))) {
    return result;
  }

  if (!parse_timestamp(time_text, result.position)) {
    result.kind = LineResult::Kind::Malformed;
    return result;
  }

  result.kind = LineResult::Kind::Progress;
  std::string_view field;
  if (find_field(trimmed, "speed=", field))
    parse_leading_number(field, result.speed);
  if (find_field(trimmed, "bitrate=", field))
    result.bitrate_kbps = kbps_from_text(field);
  return result;
}

// **----- FfmpegProgressRules -----**

LineResult FfmpegProgressRules::classify(std::string_view line,
                                         OutputStream stream) {
  LineResult result;
  std::string_view trimmed = trim(line);

  if (stream == OutputStream::StdErr) {
    classify_duration(trimmed, result);
    return result;
  }

  std::size_t eq = trimmed.find('=');
  if (eq == std::string_view::npos)
    return result;
  std::string_view key = trimmed.substr(0, eq);
  std::string_view value = trimmed.substr(eq + 1);

  if (key == "out_time_us" || key == "out_time_ms") {
    /// Both keys carry microseconds in every ffmpeg release
    double us = 0.0;
    if (parse_leading_number(value, us)) {
      position_ = us / 1000000.0;
      have_time_ = true;
    } else {
      time_malformed_ = true;
    }
    result.kind = LineResult::Kind::Absorbed;
  } else if (key == "out_time") {
    double seconds = 0.0;
    if (!have_time_ && parse_timestamp(value, seconds)) {
      position_ = seconds;
      have_time_ = true;
    }
    result.kind = LineResult::Kind::Absorbed;
  } else if (key == "speed") {
    speed_ = 0.0;
    parse_leading_number(value, speed_);
    result.kind = LineResult::Kind::Absorbed;
  } else if (key == "bitrate") {
    bitrate_kbps_ = kbps_from_text(value);
    result.kind = LineResult::Kind::Absorbed;
  } else if (key == "progress") {
    if (have_time_) {
      result.kind = LineResult::Kind::Progress;
      result.position = position_;
      result.speed = speed_;
      result.bitrate_kbps = bitrate_kbps_;
    } else {
      result.kind = time_malformed_ ? LineResult::Kind::Malformed
                                    : LineResult::Kind::Absorbed;
    }
    have_time_ = false;
    time_malformed_ = false;
    position_ = 0.0;
    speed_ = 0.0;
    bitrate_kbps_ = 0.0;
  } else {
    /// frame=, fps=, total_size=, dup_frames=, ...
    result.kind = LineResult::Kind::Absorbed;
  }
  return result;
}

// **----- OutputParser -----**

OutputParser::OutputParser(std::unique_ptr<LineRules> rules,
                           std::size_t tail_lines)
    : rules_(rules ? std::move(rules) : std::make_unique<FfmpegStatsRules>()),
      tail_lines_(tail_lines) {}

std::vector<ProgressEvent> OutputParser::feed(std::string_view chunk,
                                              OutputStream stream) {
  std::vector<ProgressEvent> events;
  std::string &partial = partial_[static_cast<int>(stream)];

  for (char c : chunk) {
    if (c == '\n' || c == '\r') {
      if (!partial.empty()) {
        handle_line(partial, stream, events);
        partial.clear();
      }
      continue;
    }
    partial.push_back(c);
    if (partial.size() >= kMaxLineLength) {
      handle_line(partial, stream, events);
      partial.clear();
    }
  }
  return events;
}

std::vector<ProgressEvent> OutputParser::flush() {
  std::vector<ProgressEvent> events;
  for (auto stream : {OutputStream::StdOut, OutputStream::StdErr}) {
    std::string &partial = partial_[static_cast<int>(stream)];
    if (!partial.empty()) {
      handle_line(partial, stream, events);
      partial.clear();
    }
  }
  return events;
}

StatusEvent OutputParser::finalize(int exit_code) const {
  StatusEvent status;
  status.exit_code = exit_code;
  status.success = (exit_code == 0);
  if (status.success)
    return status;

  status.diagnostics.assign(tail_.begin(), tail_.end());

  auto last = std::find_if(tail_.rbegin(), tail_.rend(),
                           [](const std::string &l) { return !l.empty(); });
  if (last != tail_.rend()) {
    status.reason = fmt::format("Encoder exited with code {}: {}", exit_code,
                                *last);
  } else {
    status.reason = fmt::format("Encoder exited with code {}", exit_code);
  }
  return status;
}

double OutputParser::duration() const {
  return duration_known_ ? duration_ : fallback_duration_;
}

void OutputParser::handle_line(std::string_view line, OutputStream stream,
                               std::vector<ProgressEvent> &events) {
  LineResult r = rules_->classify(line, stream);

  switch (r.kind) {
  case LineResult::Kind::Duration:
    /// First occurrence wins (later inputs/outputs repeat the banner)
    if (!duration_known_) {
      duration_ = r.duration;
      duration_known_ = true;
    }
    break;

  case LineResult::Kind::Progress: {
    position_ = std::max(position_, std::max(0.0, r.position));
    ProgressEvent ev;
    ev.position = position_;
    ev.duration = duration();
    ev.percent =
        ev.duration > 0.0 ? std::min(100.0, position_ / ev.duration * 100.0)
                          : 0.0;
    ev.speed = r.speed;
    ev.bitrate_kbps = r.bitrate_kbps;
    events.push_back(ev);
    break;
  }

  case LineResult::Kind::Malformed:
    ++parse_warnings_;
    break;

  case LineResult::Kind::Ignored:
    if (stream == OutputStream::StdErr)
      remember_diagnostic(trim(line));
    break;

  case LineResult::Kind::Absorbed:
    break;
  }
}

void OutputParser::remember_diagnostic(std::string_view line) {
  if (tail_lines_ == 0 || line.empty())
    return;
  tail_.emplace_back(line);
  while (tail_.size() > tail_lines_)
    tail_.pop_front();
}

} // namespace media_convert
