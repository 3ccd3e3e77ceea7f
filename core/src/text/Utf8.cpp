#include "ps/text/Utf8.hpp"
#include <cstdint>

namespace ps {

static constexpr char32_t kReplacement = 0xFFFD;

static bool isScalar(char32_t cp) {
  return cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
}

std::u32string decodeUtf8(const std::string& s) {
  std::u32string out;
  out.reserve(s.size());

  std::size_t i = 0;
  const std::size_t n = s.size();
  while (i < n) {
    auto b0 = static_cast<std::uint8_t>(s[i]);
    if (b0 < 0x80) {
      out.push_back(b0);
      i++;
      continue;
    }

    int extra = 0;
    char32_t cp = 0;
    char32_t minValue = 0;
    if ((b0 & 0xE0) == 0xC0)      { extra = 1; cp = b0 & 0x1F; minValue = 0x80; }
    else if ((b0 & 0xF0) == 0xE0) { extra = 2; cp = b0 & 0x0F; minValue = 0x800; }
    else if ((b0 & 0xF8) == 0xF0) { extra = 3; cp = b0 & 0x07; minValue = 0x10000; }
    else {
      out.push_back(kReplacement);
      i++;
      continue;
    }

    std::size_t j = i + 1;
    bool ok = true;
    for (int k = 0; k < extra; k++, j++) {
      if (j >= n) { ok = false; break; }
      auto b = static_cast<std::uint8_t>(s[j]);
      if ((b & 0xC0) != 0x80) { ok = false; break; }
      cp = (cp << 6) | (b & 0x3F);
    }

    if (!ok) {
      // Resynchronise on the first byte that was not a continuation.
      out.push_back(kReplacement);
      i = j > i + 1 ? j : i + 1;
      continue;
    }

    out.push_back((cp < minValue || !isScalar(cp)) ? kReplacement : cp);
    i = j;
  }
  return out;
}

std::string encodeUtf8(const std::u32string& s) {
  std::string out;
  out.reserve(s.size());
  for (char32_t cp : s) {
    if (!isScalar(cp)) cp = kReplacement;
    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }
  return out;
}

} // namespace ps
