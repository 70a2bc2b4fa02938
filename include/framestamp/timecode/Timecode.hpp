// Repository: Framestamp
// Component: Timecode Value Type
// Purpose: Immutable SMPTE timecode bound to a frame rate; exact frame
//          arithmetic and rate conversion.
// Copyright (c) 2025 Framestamp

#ifndef FRAMESTAMP_TIMECODE_TIMECODE_HPP_
#define FRAMESTAMP_TIMECODE_TIMECODE_HPP_

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "framestamp/timecode/TimecodeTypes.hpp"
#include "framestamp/timing/FrameRate.hpp"

namespace framestamp::timecode {

struct TimecodeResult;

// =============================================================================
// Timecode
//
// The frame count is the only state; the HH:MM:SS:FF form is derived from it
// on demand. 0 <= frame_count <= Rate().MaxFrameCount() always holds, so
// every value renders with two-digit hours and parses back. Because the
// text form is computed from the count, a drop-frame Timecode can never
// render a skipped label.
//
// Values are immutable. Every transform returns a new Timecode through a
// TimecodeResult; nothing is modified in place.
// =============================================================================

class Timecode {
 public:
  // Parse `text` at the rate named by `rate_name`.
  // Throws TimecodeException on any failure.
  Timecode(const std::string& text, const std::string& rate_name);

  // Non-throwing form of the constructor above. A separator that does not
  // match the rate is accepted and reported as a warning.
  static TimecodeResult Parse(const std::string& text, const std::string& rate_name);
  static TimecodeResult Parse(const std::string& text, const timing::FrameRate& rate);

  // Build from an absolute frame count in [0, rate.MaxFrameCount()].
  static TimecodeResult FromFrames(int64_t frame_count, const std::string& rate_name);
  static TimecodeResult FromFrames(int64_t frame_count, const timing::FrameRate& rate);

  int64_t FrameCount() const { return frame_count_; }
  const timing::FrameRate& Rate() const { return timing::GetFrameRate(rate_id_); }
  std::string RateName() const { return Rate().name; }
  bool IsDropFrame() const { return Rate().drop_frame; }

  int32_t Hours() const { return Fields().hours; }
  int32_t Minutes() const { return Fields().minutes; }
  int32_t Seconds() const { return Fields().seconds; }
  int32_t Frames() const { return Fields().frames; }
  TimecodeFields Fields() const;

  // Canonical text: ':' before the frame field for non-drop rates, ';' for
  // drop-frame rates.
  std::string ToString() const;

  // ---------------------------------------------------------------------------
  // Arithmetic
  // ---------------------------------------------------------------------------

  // frame_count + n at the same rate. Fails with kNegativeFrameCount below
  // zero and kFrameCountOutOfRange past 99:59:59:FF.
  TimecodeResult AddFrames(int64_t n) const;
  TimecodeResult SubFrames(int64_t n) const;

  // Sum of both frame counts. Fails with kRateMismatch if rates differ.
  TimecodeResult Add(const Timecode& other) const;

  // ---------------------------------------------------------------------------
  // Rate conversion
  //
  // Both modes rescale through real time and truncate toward zero.
  // ---------------------------------------------------------------------------

  // Same real-time instant, measured from 00:00:00:00.
  TimecodeResult ConvertTo(const std::string& rate_name) const;
  TimecodeResult ConvertTo(const timing::FrameRate& rate) const;

  // Same offset from `start`, which must be at this Timecode's rate. The
  // anchor is converted on its own and the offset is rescaled separately,
  // so rounding error is relative to the anchor instead of to zero.
  TimecodeResult ConvertWithStart(const std::string& rate_name, const Timecode& start) const;
  TimecodeResult ConvertWithStart(const timing::FrameRate& rate, const Timecode& start) const;

  bool operator==(const Timecode& other) const {
    return rate_id_ == other.rate_id_ && frame_count_ == other.frame_count_;
  }
  bool operator!=(const Timecode& other) const { return !(*this == other); }

  // Ordering is defined across rates by (rate id, frame count); it is only
  // meaningful between Timecodes at the same rate.
  bool operator<(const Timecode& other) const {
    if (rate_id_ != other.rate_id_) return rate_id_ < other.rate_id_;
    return frame_count_ < other.frame_count_;
  }
  bool operator>(const Timecode& other) const { return other < *this; }
  bool operator<=(const Timecode& other) const { return !(other < *this); }
  bool operator>=(const Timecode& other) const { return !(*this < other); }

 private:
  Timecode(int64_t frame_count, timing::FrameRateId rate_id)
      : frame_count_(frame_count), rate_id_(rate_id) {}

  int64_t frame_count_;
  timing::FrameRateId rate_id_;
};

std::ostream& operator<<(std::ostream& os, const Timecode& tc);

// =============================================================================
// TimecodeResult
// Either a Timecode or the reason there is none.
// =============================================================================

struct TimecodeResult {
  bool valid;
  TimecodeError error;
  std::string detail;
  std::optional<Timecode> timecode;
  std::vector<TimecodeWarning> warnings;

  static TimecodeResult Success(const Timecode& tc,
                                std::vector<TimecodeWarning> warnings = {}) {
    return {true, TimecodeError::kNone, "", tc, std::move(warnings)};
  }

  static TimecodeResult Failure(TimecodeError err, const std::string& detail = "") {
    return {false, err, detail, std::nullopt, {}};
  }

  bool HasWarning(TimecodeWarning w) const {
    for (const auto& warning : warnings) {
      if (warning == w) return true;
    }
    return false;
  }
};

}  // namespace framestamp::timecode

#endif  // FRAMESTAMP_TIMECODE_TIMECODE_HPP_
