#pragma once
#include "ps/anim/TextAnimation.hpp"

namespace ps {

// Caret visibility toggled on a fixed period, independent of the text
// animation clock.
class CursorBlink {
public:
  CursorBlink(Seconds period, Seconds start);

  // Flips at most once per call; the next flip is one period after the
  // previously scheduled one. Returns the visibility after the update.
  bool update(Seconds now);

  bool visible() const { return visible_; }
  Seconds period() const { return period_; }
  Seconds nextFlip() const { return nextFlip_; }

private:
  Seconds period_;
  Seconds nextFlip_;
  bool visible_{false};
};

} // namespace ps
