// Repository: Framestamp
// Component: Frame Rate Registry Implementation
// Purpose: Rate table, identifier resolution, and real-time rescaling.
// Copyright (c) 2025 Framestamp

#include "framestamp/timing/FrameRate.hpp"

#include <regex>

extern "C" {
#include <libavutil/mathematics.h>
#include <libavutil/rational.h>
}

namespace framestamp::timing {

namespace {

constexpr std::array<FrameRate, kFrameRateCount> kFrameRates = {{
    {FrameRateId::k24, "24", FPS_24, 24, false, 0},
    {FrameRateId::k25, "25", FPS_25, 25, false, 0},
    {FrameRateId::k30, "30", FPS_30, 30, false, 0},
    {FrameRateId::k50, "50", FPS_50, 50, false, 0},
    {FrameRateId::k60, "60", FPS_60, 60, false, 0},
    // Drop-frame rates skip nominal/15 labels per minute: 2 at 30, 4 at 60.
    {FrameRateId::k2997, "29.97", FPS_2997, 30, true, 2},
    {FrameRateId::k5994, "59.94", FPS_5994, 60, true, 4},
}};

// Duration of one frame as an FFmpeg time base (1001/30000 for 29.97).
AVRational FrameDuration(const RationalFps& fps) {
  return av_make_q(static_cast<int>(fps.den), static_cast<int>(fps.num));
}

}  // namespace

const std::array<FrameRate, kFrameRateCount>& SupportedFrameRates() {
  return kFrameRates;
}

const FrameRate& GetFrameRate(FrameRateId id) {
  return kFrameRates[static_cast<size_t>(id)];
}

std::optional<FrameRate> ResolveFrameRate(const std::string& name) {
  for (const auto& rate : kFrameRates) {
    if (name == rate.name) {
      return rate;
    }
  }

  // Rational form, as carried by media stream metadata ("30000/1001").
  static const std::regex kRationalPattern(R"((\d{1,9})/(\d{1,9}))");
  std::smatch match;
  if (!std::regex_match(name, match, kRationalPattern)) {
    return std::nullopt;
  }
  const RationalFps fps(std::stoll(match[1].str()), std::stoll(match[2].str()));
  if (!fps.IsValid()) {
    return std::nullopt;
  }
  for (const auto& rate : kFrameRates) {
    if (rate.fps == fps) {
      return rate;
    }
  }
  return std::nullopt;
}

int64_t RescaleFrameCount(int64_t frames, const FrameRate& from, const FrameRate& to) {
  if (from == to) {
    return frames;
  }
  return av_rescale_q_rnd(frames, FrameDuration(from.fps), FrameDuration(to.fps),
                          AV_ROUND_ZERO);
}

}  // namespace framestamp::timing
