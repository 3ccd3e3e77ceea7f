#pragma once
#include <string>

namespace ps {

// Wall-clock time within a day.
struct TimeOfDay {
  int hour{0};
  int minute{0};
  int second{0};
  double fraction{0};  // [0,1)

  double secondsSinceMidnight() const {
    return hour * 3600.0 + minute * 60.0 + second + fraction;
  }
};

// "H:M:S" or "HH:MM:SS" with an optional ".fff" fraction.
bool parseTimeOfDay(const std::string& text, TimeOfDay& out);

// "%H:%M:%S", fraction dropped.
std::string formatTimeOfDay(const TimeOfDay& t);

// Current local time of day.
TimeOfDay localTimeOfDay();

} // namespace ps
