// Repository: Framestamp
// Component: Frame Rate Registry
// Purpose: Closed set of supported broadcast frame rates.
// Copyright (c) 2025 Framestamp

#ifndef FRAMESTAMP_TIMING_FRAME_RATE_HPP_
#define FRAMESTAMP_TIMING_FRAME_RATE_HPP_

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "framestamp/timing/RationalFps.hpp"

namespace framestamp::timing {

enum class FrameRateId : int32_t {
  k24 = 0,
  k25,
  k30,
  k50,
  k60,
  k2997,
  k5994,
};

// =============================================================================
// FrameRate
// One row of the registry. Every field is derived from the id; there is no
// way to build a FrameRate with, say, drop_frame set on an integer rate.
// =============================================================================

struct FrameRate {
  FrameRateId id;
  const char* name;         // Canonical identifier ("25", "29.97")
  RationalFps fps;          // Exact real-time rate (30000/1001)
  int32_t nominal_fps;      // Frame field modulus (30 for 29.97)
  bool drop_frame;          // SMPTE drop-frame counting applies
  int32_t dropped_per_minute;  // Labels skipped per non-tenth minute

  // Frame field separator used when rendering.
  char Separator() const { return drop_frame ? ';' : ':'; }

  // Frames in one labelled minute that is not a multiple of ten.
  int64_t FramesPerMinute() const {
    return static_cast<int64_t>(nominal_fps) * 60 - dropped_per_minute;
  }

  // Frames in ten labelled minutes.
  int64_t FramesPerTenMinutes() const {
    return static_cast<int64_t>(nominal_fps) * 600 - 9LL * dropped_per_minute;
  }

  // Last frame of 99:59:59:FF. Larger counts have no two-digit hour label.
  int64_t MaxFrameCount() const { return 100 * 6 * FramesPerTenMinutes() - 1; }

  bool operator==(const FrameRate& other) const { return id == other.id; }
  bool operator!=(const FrameRate& other) const { return id != other.id; }
};

inline constexpr size_t kFrameRateCount = 7;

// Static registry, ordered by FrameRateId.
const std::array<FrameRate, kFrameRateCount>& SupportedFrameRates();

// Total lookup for the enumeration.
const FrameRate& GetFrameRate(FrameRateId id);

// Resolve a rate identifier. Accepts the canonical decimal names ("24",
// "29.97", "59.94", ...) and exact rational strings ("30000/1001", "25/1").
// Returns empty optional for anything outside the supported set.
std::optional<FrameRate> ResolveFrameRate(const std::string& name);

// Rescale a frame count from one rate to another through real time:
//   frames * (1/from) / (1/to)
// computed exactly and truncated toward zero. Negative counts are allowed
// (offsets) and truncate toward zero as well.
int64_t RescaleFrameCount(int64_t frames, const FrameRate& from, const FrameRate& to);

}  // namespace framestamp::timing

#endif  // FRAMESTAMP_TIMING_FRAME_RATE_HPP_
