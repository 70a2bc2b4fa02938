// Repository: Framestamp
// Component: Timecode Types Implementation
// Copyright (c) 2025 Framestamp

#include "framestamp/timecode/TimecodeTypes.hpp"

namespace framestamp::timecode {

// New error codes may be added; existing codes must not change meaning
const char* TimecodeErrorToString(TimecodeError error) {
  switch (error) {
    case TimecodeError::kNone:
      return "NONE";
    case TimecodeError::kUnsupportedRate:
      return "UNSUPPORTED_RATE";
    case TimecodeError::kMalformedTimecode:
      return "MALFORMED_TIMECODE";
    case TimecodeError::kFrameOverflow:
      return "FRAME_OVERFLOW";
    case TimecodeError::kNegativeFrameCount:
      return "NEGATIVE_FRAME_COUNT";
    case TimecodeError::kRateMismatch:
      return "RATE_MISMATCH";
    case TimecodeError::kMinutesOutOfRange:
      return "MINUTES_OUT_OF_RANGE";
    case TimecodeError::kSecondsOutOfRange:
      return "SECONDS_OUT_OF_RANGE";
    case TimecodeError::kDroppedFrameLabel:
      return "DROPPED_FRAME_LABEL";
    case TimecodeError::kFrameCountOutOfRange:
      return "FRAME_COUNT_OUT_OF_RANGE";
  }
  return "UNKNOWN_ERROR";
}

const char* TimecodeWarningToString(TimecodeWarning warning) {
  switch (warning) {
    case TimecodeWarning::kMismatchSeparator:
      return "MISMATCH_SEPARATOR";
  }
  return "UNKNOWN_WARNING";
}

}  // namespace framestamp::timecode
