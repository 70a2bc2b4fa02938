// Repository: Framestamp
// Component: Timecode Types
// Purpose: Error codes, warnings, and the unvalidated field record.
// Copyright (c) 2025 Framestamp

#ifndef FRAMESTAMP_TIMECODE_TYPES_HPP_
#define FRAMESTAMP_TIMECODE_TYPES_HPP_

#include <cstdint>
#include <stdexcept>
#include <string>

namespace framestamp::timecode {

// =============================================================================
// Error Codes
// =============================================================================

enum class TimecodeError {
  // No error
  kNone = 0,

  // Rate identifier is not in the supported set
  kUnsupportedRate,

  // Text does not match HH:MM:SS:FF / HH:MM:SS;FF with two digits per field
  kMalformedTimecode,

  // Frame field >= the rate's nominal frames per second
  kFrameOverflow,

  // Arithmetic or conversion would produce a frame count below zero
  kNegativeFrameCount,

  // Two timecodes that must share a rate do not
  kRateMismatch,

  // Minutes field >= 60
  kMinutesOutOfRange,

  // Seconds field >= 60
  kSecondsOutOfRange,

  // Drop-frame label that SMPTE skips (e.g. 00:01:00;00 at 29.97)
  kDroppedFrameLabel,

  // Frame count past 99:59:59:FF at the rate
  kFrameCountOutOfRange,
};

// Convert error code to string for logging
const char* TimecodeErrorToString(TimecodeError error);

// =============================================================================
// Warnings
// Accepted input that deviates from canonical form.
// =============================================================================

enum class TimecodeWarning {
  // ';' given for a non-drop rate, or ':' for a drop-frame rate
  kMismatchSeparator,
};

const char* TimecodeWarningToString(TimecodeWarning warning);

// Thrown by the textual Timecode constructor. Every other entry point
// reports through TimecodeResult instead.
class TimecodeException : public std::invalid_argument {
 public:
  TimecodeException(TimecodeError error, const std::string& detail)
      : std::invalid_argument(std::string(TimecodeErrorToString(error)) + ": " + detail),
        error_(error) {}

  TimecodeError error() const { return error_; }

 private:
  TimecodeError error_;
};

// =============================================================================
// TimecodeFields
// Lexical view of a timecode string. Knows nothing about frame rates, so
// any field may still be out of range for the rate it is later checked
// against.
// =============================================================================

struct TimecodeFields {
  int32_t hours = 0;
  int32_t minutes = 0;
  int32_t seconds = 0;
  int32_t frames = 0;
  char separator = ':';  // Separator before the frame field

  bool operator==(const TimecodeFields& other) const {
    return hours == other.hours && minutes == other.minutes &&
           seconds == other.seconds && frames == other.frames &&
           separator == other.separator;
  }
  bool operator!=(const TimecodeFields& other) const { return !(*this == other); }
};

}  // namespace framestamp::timecode

#endif  // FRAMESTAMP_TIMECODE_TYPES_HPP_
