#include "ps/app/Args.hpp"

#include <utility>

namespace ps {

static ArgsResult failArgs(std::string error) {
  ArgsResult r;
  r.showHelp = true;
  r.error = std::move(error);
  return r;
}

ArgsResult parseArgs(const std::vector<std::string>& argv) {
  std::string startText;
  bool haveStart = false;
  bool haveTopic = false;
  ArgsResult r;

  for (std::size_t i = 1; i < argv.size(); i++) {
    const std::string& a = argv[i];
    bool hasValue = i + 1 < argv.size();

    if (a == "--start-time") {
      if (!hasValue) return failArgs("Start time not provided");
      startText = argv[++i];
      haveStart = true;
    } else if (a == "--topic") {
      if (!hasValue) return failArgs("Topic not provided");
      r.args.topic = argv[++i];
      haveTopic = true;
    } else if (a == "--config") {
      if (!hasValue) return failArgs("Config path not provided");
      r.args.configPath = argv[++i];
    } else {
      return failArgs("");
    }
  }

  if (!haveStart) return failArgs("Start time not provided");
  if (!parseTimeOfDay(startText, r.args.startTime))
    return failArgs("Failed to parse start time: " + startText);
  if (!haveTopic) return failArgs("Topic not provided");

  r.ok = true;
  return r;
}

ArgsResult parseArgs(int argc, const char* const* argv) {
  std::vector<std::string> v;
  for (int i = 0; i < argc; i++) v.emplace_back(argv[i]);
  return parseArgs(v);
}

std::string usageText(const std::string& programName) {
  return "A pre-stream screen...\n"
         "\n"
         "Usage:\n" +
         programName + " [args]\n"
         "\n"
         "Arguments:\n"
         "--start-time: when stream starts\n"
         "--topic: what are we working on today\n"
         "--config: optional scene configuration (JSON)\n";
}

} // namespace ps
