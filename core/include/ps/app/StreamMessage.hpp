#pragma once
#include "ps/app/TimeOfDay.hpp"

#include <string>

namespace ps {

// The banner typed on screen:
//
//   $ ./<program>
//
//   Today's topic: <topic>
//   Stream starting at HH:MM:SS
//       Current time: HH:MM:SS
//       HH:MM:SS 'till stream starts
//
// The countdown is start - now within the same day (negative once the start
// has passed), each field truncated toward zero.
std::string streamStartingString(const std::string& programName,
                                 const std::string& topic,
                                 const TimeOfDay& start,
                                 const TimeOfDay& now);

} // namespace ps
