#include "ps/anim/CursorBlink.hpp"

namespace ps {

CursorBlink::CursorBlink(Seconds period, Seconds start)
  : period_(period), nextFlip_(start + period) {}

bool CursorBlink::update(Seconds now) {
  if (nextFlip_ < now) {
    nextFlip_ += period_;
    visible_ = !visible_;
  }
  return visible_;
}

} // namespace ps
