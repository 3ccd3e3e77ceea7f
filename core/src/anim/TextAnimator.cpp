#include "ps/anim/TextAnimator.hpp"

#include <utility>

namespace ps {

TextAnimator::TextAnimator(TargetProvider provider, AnimationTimings timings)
  : provider_(std::move(provider)), timings_(timings) {}

void TextAnimator::reset(std::u32string initial) {
  refill(std::move(initial));
}

void TextAnimator::refill(std::u32string finished) {
  std::u32string target = provider_ ? provider_() : std::u32string{};
  queue_ = diffAndQueue(finished, target, timings_);
  state_ = Idle{std::move(finished)};
  refills_++;
}

void TextAnimator::tick(Seconds now) {
  if (isFinished(state_, now)) {
    AnimationState done = std::move(state_);
    state_ = Idle{};
    std::u32string finished = intoFinishedString(std::move(done));

    if (queue_.empty()) {
      refill(std::move(finished));
    } else {
      AnimationRequest next = std::move(queue_.front());
      queue_.pop_front();
      state_ = applyRequest(std::move(next), std::move(finished), now);
    }
  }

  update(state_, now);
}

} // namespace ps
