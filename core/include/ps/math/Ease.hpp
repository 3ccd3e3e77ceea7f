#pragma once
#include <cmath>

namespace ps {

// Accelerating curve over [0,1]: 0 -> 0, 1 -> 1.
inline float easeInSine(float t) {
  constexpr float kHalfPi = 1.57079632679489661923f;
  return 1.0f - std::cos(t * kHalfPi);
}

} // namespace ps
