#pragma once
#include "ps/anim/TextAnimation.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace ps {

// Drives an AnimationState through its queue. When the queue drains, asks
// the provider for a fresh target and queues the transition to it.
class TextAnimator {
public:
  using TargetProvider = std::function<std::u32string()>;

  TextAnimator(TargetProvider provider, AnimationTimings timings = AnimationTimings{});

  // Show `initial` and queue the transition from it to the current target.
  void reset(std::u32string initial);

  // One tick of the loop: settle a finished state, pull the next request (or
  // refill), then advance whatever is current.
  void tick(Seconds now);

  const std::u32string& text() const { return currentText(state_); }
  const AnimationState& state() const { return state_; }
  const AnimationQueue& queue() const { return queue_; }

  std::uint64_t refillCount() const { return refills_; }

private:
  TargetProvider provider_;
  AnimationTimings timings_;
  AnimationState state_{Idle{}};
  AnimationQueue queue_;
  std::uint64_t refills_{0};

  void refill(std::u32string finished);
};

} // namespace ps
