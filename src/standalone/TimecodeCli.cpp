// Repository: Framestamp
// Component: Timecode Command-Line Driver
// Purpose: Argument parsing and execution for framestamp_cli.
// Copyright (c) 2025 Framestamp

#include "TimecodeCli.hpp"

#include <sstream>
#include <stdexcept>

#include "framestamp/timecode/Timecode.hpp"
#include "framestamp/util/Logger.hpp"

namespace framestamp::cli {

using timecode::Timecode;
using timecode::TimecodeError;
using timecode::TimecodeErrorToString;
using timecode::TimecodeResult;
using timecode::TimecodeWarningToString;
using util::Logger;

namespace {

constexpr const char* kTag = "[framestamp_cli] ";

bool ParseInt64(const std::string& text, int64_t& out_value) {
  try {
    size_t consumed = 0;
    out_value = std::stoll(text, &consumed);
    return consumed == text.size();
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
}

void LogFailure(const char* step, const TimecodeResult& result) {
  std::ostringstream oss;
  oss << kTag << step << " failed: " << TimecodeErrorToString(result.error);
  if (!result.detail.empty()) {
    oss << " (" << result.detail << ")";
  }
  Logger::Error(oss.str());
}

void LogWarnings(const char* step, const TimecodeResult& result) {
  for (const auto& warning : result.warnings) {
    std::ostringstream oss;
    oss << kTag << step << " warning: " << TimecodeWarningToString(warning);
    Logger::Warn(oss.str());
  }
}

}  // namespace

void PrintUsage(std::ostream& os, const char* program_name) {
  os << "Usage: " << program_name << " [OPTIONS]\n"
     << "\n"
     << "Parse, offset and convert SMPTE timecodes.\n"
     << "\n"
     << "INPUT (one of):\n"
     << "  --tc TEXT            Timecode, HH:MM:SS:FF or HH:MM:SS;FF\n"
     << "  --frames N           Absolute frame count\n"
     << "  --rate NAME          Input rate: 24 25 30 50 60 29.97 59.94 (or 30000/1001 ...)\n"
     << "\n"
     << "TRANSFORMS (applied in this order):\n"
     << "  --add N              Add N frames\n"
     << "  --sub N              Subtract N frames\n"
     << "  --convert NAME       Convert to another rate\n"
     << "  --start TEXT         Anchor --convert at this timecode (input rate)\n"
     << "\n"
     << "  --help               Show this help message\n"
     << "\n"
     << "EXAMPLES:\n"
     << "  " << program_name << " --tc 01:02:03:04 --rate 25 --add 4 --convert 59.94\n"
     << "  " << program_name << " --tc 01:02:03:08 --rate 25 --convert 59.94 --start 01:00:00:00\n"
     << "\n"
     << "Set FRAMESTAMP_DEBUG=1 for intermediate values.\n";
}

CliArgs ParseArgs(int argc, const char* const argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--tc" && i + 1 < argc) {
      args.tc_text = argv[++i];
    } else if (arg == "--frames" && i + 1 < argc) {
      int64_t frames = 0;
      if (!ParseInt64(argv[++i], frames)) {
        args.error = "--frames expects an integer, got '" + std::string(argv[i]) + "'";
        return args;
      }
      args.frames = frames;
    } else if (arg == "--rate" && i + 1 < argc) {
      args.rate = argv[++i];
    } else if (arg == "--add" && i + 1 < argc) {
      if (!ParseInt64(argv[++i], args.add_frames)) {
        args.error = "--add expects an integer, got '" + std::string(argv[i]) + "'";
        return args;
      }
    } else if (arg == "--sub" && i + 1 < argc) {
      if (!ParseInt64(argv[++i], args.sub_frames)) {
        args.error = "--sub expects an integer, got '" + std::string(argv[i]) + "'";
        return args;
      }
    } else if (arg == "--convert" && i + 1 < argc) {
      args.convert_rate = argv[++i];
    } else if (arg == "--start" && i + 1 < argc) {
      args.start_text = argv[++i];
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (args.tc_text.empty() && !args.frames) {
    args.error = "Must specify either --tc or --frames";
    return args;
  }

  if (!args.tc_text.empty() && args.frames) {
    args.error = "Cannot use both --tc and --frames";
    return args;
  }

  if (args.rate.empty()) {
    args.error = "Must specify --rate";
    return args;
  }

  if (!args.start_text.empty() && args.convert_rate.empty()) {
    args.error = "--start requires --convert";
    return args;
  }

  args.valid = true;
  return args;
}

int RunCli(const CliArgs& args) {
  TimecodeResult current = args.frames ? Timecode::FromFrames(*args.frames, args.rate)
                                       : Timecode::Parse(args.tc_text, args.rate);
  if (!current.valid) {
    LogFailure("input", current);
    return kExitTimecodeError;
  }
  LogWarnings("input", current);

  {
    std::ostringstream oss;
    oss << kTag << "input " << *current.timecode
        << " frame_count=" << current.timecode->FrameCount();
    Logger::Debug(oss.str());
  }

  if (args.add_frames != 0) {
    current = current.timecode->AddFrames(args.add_frames);
    if (!current.valid) {
      LogFailure("add", current);
      return kExitTimecodeError;
    }
  }

  if (args.sub_frames != 0) {
    current = current.timecode->SubFrames(args.sub_frames);
    if (!current.valid) {
      LogFailure("sub", current);
      return kExitTimecodeError;
    }
  }

  if (!args.convert_rate.empty()) {
    const Timecode source = *current.timecode;
    if (args.start_text.empty()) {
      current = source.ConvertTo(args.convert_rate);
    } else {
      TimecodeResult start = Timecode::Parse(args.start_text, source.Rate());
      if (!start.valid) {
        LogFailure("start", start);
        return kExitTimecodeError;
      }
      LogWarnings("start", start);
      current = source.ConvertWithStart(args.convert_rate, *start.timecode);
    }
    if (!current.valid) {
      LogFailure("convert", current);
      return kExitTimecodeError;
    }
  }

  const Timecode& tc = *current.timecode;
  std::ostringstream oss;
  oss << kTag << "timecode=" << tc << " frame_count=" << tc.FrameCount()
      << " rate=" << tc.RateName() << " drop_frame=" << (tc.IsDropFrame() ? "true" : "false")
      << " elapsed_us=" << tc.Rate().fps.DurationFromFramesUs(tc.FrameCount());
  Logger::Info(oss.str());
  return kExitOk;
}

}  // namespace framestamp::cli
