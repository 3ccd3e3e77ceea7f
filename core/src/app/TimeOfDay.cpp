#include "ps/app/TimeOfDay.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace ps {

static bool parseField(const std::string& s, std::size_t& pos, int maxValue, int& out) {
  std::size_t start = pos;
  int v = 0;
  while (pos < s.size() && pos - start < 2 && s[pos] >= '0' && s[pos] <= '9') {
    v = v * 10 + (s[pos] - '0');
    pos++;
  }
  if (pos == start || v > maxValue) return false;
  out = v;
  return true;
}

bool parseTimeOfDay(const std::string& text, TimeOfDay& out) {
  TimeOfDay t;
  std::size_t pos = 0;
  if (!parseField(text, pos, 23, t.hour)) return false;
  if (pos >= text.size() || text[pos] != ':') return false;
  pos++;
  if (!parseField(text, pos, 59, t.minute)) return false;
  if (pos >= text.size() || text[pos] != ':') return false;
  pos++;
  if (!parseField(text, pos, 59, t.second)) return false;

  if (pos < text.size() && text[pos] == '.') {
    pos++;
    double scale = 0.1;
    std::size_t digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      t.fraction += (text[pos] - '0') * scale;
      scale *= 0.1;
      pos++;
      digits++;
    }
    if (digits == 0) return false;
  }
  if (pos != text.size()) return false;

  out = t;
  return true;
}

std::string formatTimeOfDay(const TimeOfDay& t) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", t.hour, t.minute, t.second);
  return buf;
}

TimeOfDay localTimeOfDay() {
  auto now = std::chrono::system_clock::now();
  std::time_t epoch = std::chrono::system_clock::to_time_t(now);
  std::tm tm;
#ifdef _WIN32
  localtime_s(&tm, &epoch);
#else
  localtime_r(&epoch, &tm);
#endif
  auto sinceEpoch = now.time_since_epoch();
  auto whole = std::chrono::duration_cast<std::chrono::seconds>(sinceEpoch);
  double frac = std::chrono::duration<double>(sinceEpoch - whole).count();
  if (frac < 0.0) frac = 0.0;

  TimeOfDay t;
  t.hour = tm.tm_hour;
  t.minute = tm.tm_min;
  t.second = tm.tm_sec > 59 ? 59 : tm.tm_sec;
  t.fraction = frac;
  return t;
}

} // namespace ps
