#pragma once
#include "ps/app/TimeOfDay.hpp"

#include <string>
#include <vector>

namespace ps {

struct Args {
  TimeOfDay startTime;
  std::string topic;
  std::string configPath;  // empty = built-in defaults
};

struct ArgsResult {
  bool ok{false};
  bool showHelp{false};
  std::string error;  // reason printed before the usage text; may be empty
  Args args;
};

// argv[1..] only; argv[0] is the program name.
ArgsResult parseArgs(const std::vector<std::string>& argv);
ArgsResult parseArgs(int argc, const char* const* argv);

std::string usageText(const std::string& programName);

} // namespace ps
