// Repository: Framestamp
// Component: Timecode Arithmetic Contract Tests
// Purpose: Frame offsets, timecode sums, ordering, immutability.
// Copyright (c) 2025 Framestamp

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>

#include "framestamp/timecode/Timecode.hpp"

namespace framestamp::timecode {
namespace {

// Add one frame to `input` and compare the rendered result.
void ExpectNextFrame(const std::string& rate, const std::string& input,
                     const std::string& expected) {
  Timecode tc(input, rate);
  TimecodeResult next = tc.AddFrames(1);
  ASSERT_TRUE(next.valid);
  EXPECT_EQ(next.timecode->ToString(), expected) << input << " @" << rate;
}

TEST(TimecodeAddFrames, OffsetsWithinOneSecond) {
  Timecode tc("01:02:03:04", "25");
  TimecodeResult r = tc.AddFrames(4);
  ASSERT_TRUE(r.valid);
  EXPECT_EQ(r.timecode->ToString(), "01:02:03:08");
  EXPECT_EQ(r.timecode->FrameCount(), 93083);
  EXPECT_FALSE(r.timecode->IsDropFrame());

  // The source value is untouched.
  EXPECT_EQ(tc.ToString(), "01:02:03:04");
  EXPECT_EQ(tc.FrameCount(), 93079);
}

TEST(TimecodeAddFrames, CarriesAcrossFields) {
  ExpectNextFrame("30", "00:01:02:00", "00:01:02:01");
  ExpectNextFrame("30", "00:01:02:29", "00:01:03:00");
  ExpectNextFrame("30", "00:01:59:29", "00:02:00:00");
  ExpectNextFrame("30", "00:59:59:29", "01:00:00:00");
  ExpectNextFrame("25", "23:59:59:24", "24:00:00:00");
}

TEST(TimecodeAddFrames, SkipsDroppedLabels) {
  ExpectNextFrame("29.97", "00:01:02;00", "00:01:02;01");
  ExpectNextFrame("29.97", "00:08:59;29", "00:09:00;02");
  ExpectNextFrame("29.97", "00:09:59;29", "00:10:00;00");
  ExpectNextFrame("29.97", "01:00:59;29", "01:01:00;02");
  ExpectNextFrame("59.94", "00:00:59;59", "00:01:00;04");
  ExpectNextFrame("59.94", "00:09:59;59", "00:10:00;00");
}

TEST(TimecodeAddFrames, CountIsMonotonic) {
  Timecode tc("00:59:59;28", "29.97");
  for (int64_t n = 0; n < 5000; n += 37) {
    TimecodeResult r = tc.AddFrames(n);
    ASSERT_TRUE(r.valid);
    EXPECT_EQ(r.timecode->FrameCount(), tc.FrameCount() + n);
    EXPECT_EQ(r.timecode->Rate(), tc.Rate());
  }
}

TEST(TimecodeAddFrames, NegativeResultRejected) {
  Timecode tc("00:00:01:00", "25");
  TimecodeResult back = tc.AddFrames(-25);
  ASSERT_TRUE(back.valid);
  EXPECT_EQ(back.timecode->ToString(), "00:00:00:00");

  TimecodeResult under = tc.AddFrames(-26);
  EXPECT_FALSE(under.valid);
  EXPECT_EQ(under.error, TimecodeError::kNegativeFrameCount);
  EXPECT_FALSE(under.timecode.has_value());
}

TEST(TimecodeSubFrames, MirrorsAddFrames) {
  Timecode tc("00:10:00;00", "29.97");
  TimecodeResult r = tc.SubFrames(1);
  ASSERT_TRUE(r.valid);
  EXPECT_EQ(r.timecode->ToString(), "00:09:59;29");

  TimecodeResult too_far = tc.SubFrames(tc.FrameCount() + 1);
  EXPECT_FALSE(too_far.valid);
  EXPECT_EQ(too_far.error, TimecodeError::kNegativeFrameCount);
}

TEST(TimecodeAddFrames, StopsAtLastLabel) {
  Timecode last("99:59:59:24", "25");
  EXPECT_EQ(last.FrameCount(), 8999999);

  TimecodeResult past = last.AddFrames(1);
  EXPECT_FALSE(past.valid);
  EXPECT_EQ(past.error, TimecodeError::kFrameCountOutOfRange);

  Timecode df_last("99:59:59;29", "29.97");
  EXPECT_EQ(df_last.AddFrames(1).error, TimecodeError::kFrameCountOutOfRange);
  TimecodeResult back = df_last.SubFrames(1);
  ASSERT_TRUE(back.valid);
  EXPECT_EQ(back.timecode->ToString(), "99:59:59;28");

  TimecodeResult to_last = Timecode("99:59:59:00", "25").AddFrames(24);
  ASSERT_TRUE(to_last.valid);
  EXPECT_EQ(*to_last.timecode, last);
}

TEST(TimecodeAddFrames, ExtremeOffsetsReportTheRightBound) {
  constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
  constexpr int64_t kMin = std::numeric_limits<int64_t>::min();
  Timecode tc("00:00:01:00", "25");

  EXPECT_EQ(tc.AddFrames(kMax).error, TimecodeError::kFrameCountOutOfRange);
  EXPECT_EQ(tc.SubFrames(kMin).error, TimecodeError::kFrameCountOutOfRange);
  EXPECT_EQ(tc.AddFrames(kMin).error, TimecodeError::kNegativeFrameCount);
  EXPECT_EQ(tc.SubFrames(kMax).error, TimecodeError::kNegativeFrameCount);

  Timecode last("99:59:59:24", "25");
  EXPECT_EQ(last.AddFrames(kMax).error, TimecodeError::kFrameCountOutOfRange);
  EXPECT_EQ(last.AddFrames(kMin).error, TimecodeError::kNegativeFrameCount);
}

TEST(TimecodeAdd, SumsFrameCountsAtSameRate) {
  Timecode a("01:00:00:00", "25");
  Timecode b("00:02:03:08", "25");
  TimecodeResult sum = a.Add(b);
  ASSERT_TRUE(sum.valid);
  EXPECT_EQ(sum.timecode->ToString(), "01:02:03:08");
}

TEST(TimecodeAdd, SumPastLastLabelRejected) {
  Timecode half("60:00:00:00", "25");
  TimecodeResult sum = half.Add(half);
  EXPECT_FALSE(sum.valid);
  EXPECT_EQ(sum.error, TimecodeError::kFrameCountOutOfRange);
}

TEST(TimecodeAdd, RejectsDifferentRates) {
  Timecode a("01:00:00:00", "25");
  Timecode b("00:00:01:00", "50");
  TimecodeResult sum = a.Add(b);
  EXPECT_FALSE(sum.valid);
  EXPECT_EQ(sum.error, TimecodeError::kRateMismatch);
}

TEST(TimecodeFromFrames, RejectsCountsOutsideRange) {
  TimecodeResult r = Timecode::FromFrames(-1, "25");
  EXPECT_FALSE(r.valid);
  EXPECT_EQ(r.error, TimecodeError::kNegativeFrameCount);

  TimecodeResult huge = Timecode::FromFrames(std::numeric_limits<int64_t>::max(), "25");
  EXPECT_FALSE(huge.valid);
  EXPECT_EQ(huge.error, TimecodeError::kFrameCountOutOfRange);

  TimecodeResult bad_rate = Timecode::FromFrames(10, "15");
  EXPECT_FALSE(bad_rate.valid);
  EXPECT_EQ(bad_rate.error, TimecodeError::kUnsupportedRate);
}

TEST(TimecodeOrdering, SameRateComparesFrameCount) {
  Timecode early("00:00:10:00", "25");
  Timecode late("00:00:10:01", "25");
  EXPECT_LT(early, late);
  EXPECT_LE(early, early);
  EXPECT_GT(late, early);
  EXPECT_GE(late, late);
  EXPECT_EQ(early, Timecode("00:00:10:00", "25"));
  EXPECT_NE(early, late);
}

TEST(TimecodeOrdering, EqualityIncludesRate) {
  // Both are frame 250, but at different rates.
  Timecode a("00:00:10:00", "25");
  TimecodeResult b = Timecode::FromFrames(250, "50");
  ASSERT_TRUE(b.valid);
  EXPECT_EQ(a.FrameCount(), b.timecode->FrameCount());
  EXPECT_NE(a, *b.timecode);
}

}  // namespace
}  // namespace framestamp::timecode
