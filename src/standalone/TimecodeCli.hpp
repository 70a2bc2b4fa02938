// Repository: Framestamp
// Component: Timecode Command-Line Driver
// Purpose: Argument parsing and execution for framestamp_cli.
// Copyright (c) 2025 Framestamp

#ifndef FRAMESTAMP_STANDALONE_TIMECODE_CLI_HPP_
#define FRAMESTAMP_STANDALONE_TIMECODE_CLI_HPP_

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace framestamp::cli {

// Exit codes
inline constexpr int kExitOk = 0;
inline constexpr int kExitTimecodeError = 1;
inline constexpr int kExitUsageError = 2;

struct CliArgs {
  // Input: exactly one of tc_text / frames
  std::string tc_text;
  std::optional<int64_t> frames;
  std::string rate;

  // Transforms, applied in this order: add, sub, convert
  int64_t add_frames = 0;
  int64_t sub_frames = 0;
  std::string convert_rate;
  std::string start_text;  // Anchor for --convert, at the input rate

  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(std::ostream& os, const char* program_name);

CliArgs ParseArgs(int argc, const char* const argv[]);

// Runs the requested transforms and logs the result through util::Logger.
// Returns one of the exit codes above.
int RunCli(const CliArgs& args);

}  // namespace framestamp::cli

#endif  // FRAMESTAMP_STANDALONE_TIMECODE_CLI_HPP_
