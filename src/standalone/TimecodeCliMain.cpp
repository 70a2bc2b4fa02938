// Repository: Framestamp
// Component: framestamp_cli entry point
// Copyright (c) 2025 Framestamp

#include <iostream>

#include "TimecodeCli.hpp"
#include "framestamp/util/Logger.hpp"

int main(int argc, char* argv[]) {
  using namespace framestamp::cli;

  CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(std::cout, argv[0]);
    return kExitOk;
  }
  if (!args.valid) {
    framestamp::util::Logger::Error("[framestamp_cli] " + args.error);
    PrintUsage(std::cerr, argv[0]);
    return kExitUsageError;
  }

  return RunCli(args);
}
