// Repository: Framestamp
// Component: Timecode Value Type Implementation
// Copyright (c) 2025 Framestamp

#include "framestamp/timecode/Timecode.hpp"

#include <limits>
#include <sstream>

#include "framestamp/timecode/TimecodeFormat.hpp"

namespace framestamp::timecode {

namespace {

TimecodeResult UnsupportedRate(const std::string& rate_name) {
  return TimecodeResult::Failure(TimecodeError::kUnsupportedRate,
                                 "rate '" + rate_name + "' is not supported");
}

TimecodeResult PastMaximum(const timing::FrameRate& rate) {
  std::ostringstream detail;
  detail << "frame count exceeds " << rate.MaxFrameCount() << " (99:59:59 at " << rate.name
         << ")";
  return TimecodeResult::Failure(TimecodeError::kFrameCountOutOfRange, detail.str());
}

}  // namespace

// =============================================================================
// Construction
// =============================================================================

Timecode::Timecode(const std::string& text, const std::string& rate_name)
    : frame_count_(0), rate_id_(timing::FrameRateId::k24) {
  TimecodeResult result = Parse(text, rate_name);
  if (!result.valid) {
    throw TimecodeException(result.error, result.detail);
  }
  *this = *result.timecode;
}

TimecodeResult Timecode::Parse(const std::string& text, const std::string& rate_name) {
  auto rate = timing::ResolveFrameRate(rate_name);
  if (!rate) {
    return UnsupportedRate(rate_name);
  }
  return Parse(text, *rate);
}

TimecodeResult Timecode::Parse(const std::string& text, const timing::FrameRate& rate) {
  auto fields = ParseTimecodeFields(text);
  if (!fields) {
    return TimecodeResult::Failure(TimecodeError::kMalformedTimecode,
                                   "'" + text + "' is not HH:MM:SS:FF or HH:MM:SS;FF");
  }

  TimecodeError error = ValidateFields(*fields, rate);
  if (error != TimecodeError::kNone) {
    std::ostringstream detail;
    detail << "'" << text << "' is not a valid " << rate.name << " timecode";
    return TimecodeResult::Failure(error, detail.str());
  }

  std::vector<TimecodeWarning> warnings;
  if (fields->separator != rate.Separator()) {
    warnings.push_back(TimecodeWarning::kMismatchSeparator);
  }

  return TimecodeResult::Success(Timecode(FieldsToFrameCount(*fields, rate), rate.id),
                                 std::move(warnings));
}

TimecodeResult Timecode::FromFrames(int64_t frame_count, const std::string& rate_name) {
  auto rate = timing::ResolveFrameRate(rate_name);
  if (!rate) {
    return UnsupportedRate(rate_name);
  }
  return FromFrames(frame_count, *rate);
}

TimecodeResult Timecode::FromFrames(int64_t frame_count, const timing::FrameRate& rate) {
  if (frame_count < 0) {
    return TimecodeResult::Failure(TimecodeError::kNegativeFrameCount,
                                   "frame count " + std::to_string(frame_count) + " < 0");
  }
  if (frame_count > rate.MaxFrameCount()) {
    return PastMaximum(rate);
  }
  return TimecodeResult::Success(Timecode(frame_count, rate.id));
}

// =============================================================================
// Rendering
// =============================================================================

TimecodeFields Timecode::Fields() const {
  return FrameCountToFields(frame_count_, Rate());
}

std::string Timecode::ToString() const {
  return FormatTimecodeFields(Fields());
}

std::ostream& operator<<(std::ostream& os, const Timecode& tc) {
  return os << tc.ToString();
}

// =============================================================================
// Arithmetic
// =============================================================================

// frame_count_ is within [0, MaxFrameCount()], so both bounds are checked
// without forming frame_count_ + n first.
TimecodeResult Timecode::AddFrames(int64_t n) const {
  if (n > Rate().MaxFrameCount() - frame_count_) {
    return PastMaximum(Rate());
  }
  if (n < -frame_count_) {
    std::ostringstream detail;
    detail << ToString() << " + (" << n << ") frames is before 00:00:00:00";
    return TimecodeResult::Failure(TimecodeError::kNegativeFrameCount, detail.str());
  }
  return TimecodeResult::Success(Timecode(frame_count_ + n, rate_id_));
}

TimecodeResult Timecode::SubFrames(int64_t n) const {
  if (n == std::numeric_limits<int64_t>::min()) {
    return PastMaximum(Rate());
  }
  return AddFrames(-n);
}

TimecodeResult Timecode::Add(const Timecode& other) const {
  if (rate_id_ != other.rate_id_) {
    std::ostringstream detail;
    detail << "cannot add " << other.RateName() << " timecode to " << RateName()
           << " timecode";
    return TimecodeResult::Failure(TimecodeError::kRateMismatch, detail.str());
  }
  return AddFrames(other.frame_count_);
}

// =============================================================================
// Rate conversion
// =============================================================================

TimecodeResult Timecode::ConvertTo(const std::string& rate_name) const {
  auto rate = timing::ResolveFrameRate(rate_name);
  if (!rate) {
    return UnsupportedRate(rate_name);
  }
  return ConvertTo(*rate);
}

TimecodeResult Timecode::ConvertTo(const timing::FrameRate& rate) const {
  return FromFrames(timing::RescaleFrameCount(frame_count_, Rate(), rate), rate);
}

TimecodeResult Timecode::ConvertWithStart(const std::string& rate_name,
                                          const Timecode& start) const {
  auto rate = timing::ResolveFrameRate(rate_name);
  if (!rate) {
    return UnsupportedRate(rate_name);
  }
  return ConvertWithStart(*rate, start);
}

TimecodeResult Timecode::ConvertWithStart(const timing::FrameRate& rate,
                                          const Timecode& start) const {
  if (start.rate_id_ != rate_id_) {
    std::ostringstream detail;
    detail << "start is " << start.RateName() << " but timecode is " << RateName();
    return TimecodeResult::Failure(TimecodeError::kRateMismatch, detail.str());
  }

  const int64_t new_start = timing::RescaleFrameCount(start.frame_count_, Rate(), rate);
  const int64_t delta = timing::RescaleFrameCount(frame_count_ - start.frame_count_, Rate(), rate);
  return FromFrames(new_start + delta, rate);
}

}  // namespace framestamp::timecode
