#include "ps/app/StreamMessage.hpp"

#include <cmath>
#include <cstdio>

namespace ps {

std::string streamStartingString(const std::string& programName,
                                 const std::string& topic,
                                 const TimeOfDay& start,
                                 const TimeOfDay& now) {
  double remaining = start.secondsSinceMidnight() - now.secondsSinceMidnight();
  auto total = static_cast<long long>(std::trunc(remaining));
  long long hours = total / 3600;
  long long minutes = (total / 60) % 60;
  long long seconds = total % 60;

  char countdown[64];
  std::snprintf(countdown, sizeof(countdown), "%02lld:%02lld:%02lld", hours, minutes, seconds);

  std::string s;
  s += "$ ./" + programName + "\n";
  s += "\n";
  s += "Today's topic: " + topic + "\n";
  s += "Stream starting at " + formatTimeOfDay(start) + "\n";
  s += "    Current time: " + formatTimeOfDay(now) + "\n";
  s += "    " + std::string(countdown) + " 'till stream starts";
  return s;
}

} // namespace ps
