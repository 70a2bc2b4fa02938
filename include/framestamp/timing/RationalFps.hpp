// Repository: Framestamp
// Component: Rational Frame Rate
// Purpose: Exact frames-per-second as a normalized integer ratio.
// Copyright (c) 2025 Framestamp

#ifndef FRAMESTAMP_TIMING_RATIONAL_FPS_HPP_
#define FRAMESTAMP_TIMING_RATIONAL_FPS_HPP_

#include <cstdint>

namespace framestamp::timing {

constexpr int64_t FpsAbs64(int64_t v) { return v < 0 ? -v : v; }

constexpr int64_t FpsGcd64(int64_t a, int64_t b) {
  a = FpsAbs64(a);
  b = FpsAbs64(b);
  while (b != 0) {
    const int64_t t = a % b;
    a = b;
    b = t;
  }
  return a == 0 ? 1 : a;
}

// Frames per second as num/den, always reduced. A non-positive ratio
// collapses to the invalid value 0/1.
struct RationalFps {
  int64_t num;
  int64_t den;

  constexpr RationalFps(int64_t n = 0, int64_t d = 1) : num(n), den(d) {
    NormalizeInPlace();
  }

  constexpr bool IsValid() const { return num > 0 && den > 0; }

  constexpr void NormalizeInPlace() {
    if (den == 0) {
      num = 0;
      den = 1;
      return;
    }
    if (den < 0) {
      den = -den;
      num = -num;
    }
    if (num <= 0) {
      num = 0;
      den = 1;
      return;
    }
    const int64_t g = FpsGcd64(num, den);
    num /= g;
    den /= g;
  }

  // True when the rate is a whole number of frames per second.
  constexpr bool IsIntegral() const { return IsValid() && den == 1; }

  // Smallest integer >= num/den (30 for 30000/1001).
  constexpr int64_t CeilFps() const {
    return IsValid() ? (num + den - 1) / den : 0;
  }

  // Floored. Exact for any count a Timecode can hold.
  constexpr int64_t DurationFromFramesUs(int64_t frames) const {
    return IsValid() ? ((frames * 1000000LL * den) / num) : 0;
  }

  constexpr bool operator==(const RationalFps& other) const {
    return num == other.num && den == other.den;
  }
  constexpr bool operator!=(const RationalFps& other) const {
    return !(*this == other);
  }
};

constexpr RationalFps FPS_24{24, 1};
constexpr RationalFps FPS_25{25, 1};
constexpr RationalFps FPS_30{30, 1};
constexpr RationalFps FPS_50{50, 1};
constexpr RationalFps FPS_60{60, 1};
constexpr RationalFps FPS_2997{30000, 1001};
constexpr RationalFps FPS_5994{60000, 1001};

}  // namespace framestamp::timing

#endif  // FRAMESTAMP_TIMING_RATIONAL_FPS_HPP_
