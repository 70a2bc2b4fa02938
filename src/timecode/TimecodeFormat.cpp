// Repository: Framestamp
// Component: Timecode Text Codec Implementation
// Copyright (c) 2025 Framestamp

#include "framestamp/timecode/TimecodeFormat.hpp"

#include <iomanip>
#include <regex>
#include <sstream>

namespace framestamp::timecode {

namespace {

int32_t TwoDigits(const std::string& s) {
  return (s[0] - '0') * 10 + (s[1] - '0');
}

}  // namespace

std::optional<TimecodeFields> ParseTimecodeFields(const std::string& text) {
  static const std::regex kTimecodePattern(R"((\d{2}):(\d{2}):(\d{2})([:;])(\d{2}))");
  std::smatch match;
  if (!std::regex_match(text, match, kTimecodePattern)) {
    return std::nullopt;
  }

  TimecodeFields fields;
  fields.hours = TwoDigits(match[1].str());
  fields.minutes = TwoDigits(match[2].str());
  fields.seconds = TwoDigits(match[3].str());
  fields.separator = match[4].str()[0];
  fields.frames = TwoDigits(match[5].str());
  return fields;
}

TimecodeError ValidateFields(const TimecodeFields& fields, const timing::FrameRate& rate) {
  if (fields.minutes >= 60) {
    return TimecodeError::kMinutesOutOfRange;
  }
  if (fields.seconds >= 60) {
    return TimecodeError::kSecondsOutOfRange;
  }
  if (fields.frames >= rate.nominal_fps) {
    return TimecodeError::kFrameOverflow;
  }
  // Drop-frame rules are the same at every rate; only the count differs.
  if (rate.drop_frame && fields.minutes % 10 != 0 && fields.seconds == 0 &&
      fields.frames < rate.dropped_per_minute) {
    return TimecodeError::kDroppedFrameLabel;
  }
  return TimecodeError::kNone;
}

int64_t FieldsToFrameCount(const TimecodeFields& fields, const timing::FrameRate& rate) {
  const int64_t total_minutes = static_cast<int64_t>(fields.hours) * 60 + fields.minutes;
  const int64_t naive =
      (total_minutes * 60 + fields.seconds) * rate.nominal_fps + fields.frames;
  if (!rate.drop_frame) {
    return naive;
  }
  return naive - rate.dropped_per_minute * (total_minutes - total_minutes / 10);
}

TimecodeFields FrameCountToFields(int64_t frame_count, const timing::FrameRate& rate) {
  int64_t label = frame_count;

  if (rate.drop_frame) {
    const int64_t drop = rate.dropped_per_minute;
    const int64_t tens = frame_count / rate.FramesPerTenMinutes();
    const int64_t rem = frame_count % rate.FramesPerTenMinutes();

    // The first minute of each ten-minute block keeps all its labels; every
    // later minute starts `drop` labels in.
    label += 9 * drop * tens;
    if (rem >= drop) {
      label += drop * ((rem - drop) / rate.FramesPerMinute());
    }
  }

  const int64_t fps = rate.nominal_fps;
  TimecodeFields fields;
  fields.frames = static_cast<int32_t>(label % fps);
  const int64_t total_seconds = label / fps;
  fields.seconds = static_cast<int32_t>(total_seconds % 60);
  fields.minutes = static_cast<int32_t>((total_seconds / 60) % 60);
  fields.hours = static_cast<int32_t>(total_seconds / 3600);
  fields.separator = rate.Separator();
  return fields;
}

std::string FormatTimecodeFields(const TimecodeFields& fields) {
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(2) << fields.hours << ':' << std::setw(2)
      << fields.minutes << ':' << std::setw(2) << fields.seconds << fields.separator
      << std::setw(2) << fields.frames;
  return oss.str();
}

}  // namespace framestamp::timecode
