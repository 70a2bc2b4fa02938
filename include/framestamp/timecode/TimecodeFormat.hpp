// Repository: Framestamp
// Component: Timecode Text Codec
// Purpose: HH:MM:SS:FF text <-> fields <-> frame count, with SMPTE
//          drop-frame compensation.
// Copyright (c) 2025 Framestamp

#ifndef FRAMESTAMP_TIMECODE_FORMAT_HPP_
#define FRAMESTAMP_TIMECODE_FORMAT_HPP_

#include <cstdint>
#include <optional>
#include <string>

#include "framestamp/timecode/TimecodeTypes.hpp"
#include "framestamp/timing/FrameRate.hpp"

namespace framestamp::timecode {

// Lexical parse of "HH:MM:SS:FF" or "HH:MM:SS;FF". Exactly two digits per
// field, no surrounding characters. Returns empty optional otherwise.
std::optional<TimecodeFields> ParseTimecodeFields(const std::string& text);

// Range checks against a rate, in order: minutes, seconds, frame field,
// dropped label. The separator is not checked here.
// Returns TimecodeError::kNone when the fields name a real frame.
TimecodeError ValidateFields(const TimecodeFields& fields, const timing::FrameRate& rate);

// Fields must have passed ValidateFields for the same rate.
int64_t FieldsToFrameCount(const TimecodeFields& fields, const timing::FrameRate& rate);

// Inverse of FieldsToFrameCount for 0 <= frame_count <= rate.MaxFrameCount().
// The separator is the rate's canonical one.
TimecodeFields FrameCountToFields(int64_t frame_count, const timing::FrameRate& rate);

// "HH:MM:SS:FF", each field zero-padded to two digits.
std::string FormatTimecodeFields(const TimecodeFields& fields);

}  // namespace framestamp::timecode

#endif  // FRAMESTAMP_TIMECODE_FORMAT_HPP_
