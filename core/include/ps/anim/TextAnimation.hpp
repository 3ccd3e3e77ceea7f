#pragma once
#include <cstddef>
#include <deque>
#include <string>
#include <variant>

namespace ps {

// Monotonic timestamps and durations, fractional seconds.
using Seconds = double;

// ---- Requests: one queued step of a text transition ----

struct DeleteRequest {
  std::size_t desiredLen{0};
  Seconds duration{0};
};

struct WaitRequest {
  Seconds duration{0};
};

struct AppendRequest {
  std::u32string chars;
  Seconds duration{0};
};

using AnimationRequest = std::variant<DeleteRequest, WaitRequest, AppendRequest>;
using AnimationQueue = std::deque<AnimationRequest>;

struct AnimationTimings {
  Seconds wait{1.5};
  Seconds erase{1.5};
  Seconds append{1.5};
};

// ---- States: exactly one phase is active ----

struct Deleting {
  std::u32string text;
  std::size_t startLen{0};
  std::size_t desiredLen{0};
  Seconds startTime{0};
  Seconds duration{0};
};

struct Appending {
  std::u32string text;
  std::size_t startLen{0};
  std::deque<char32_t> pending;  // consumed from the front
  Seconds startTime{0};
  Seconds duration{0};
};

struct Waiting {
  std::u32string text;
  Seconds endTime{0};
};

struct Idle {
  std::u32string text;
};

using AnimationState = std::variant<Deleting, Appending, Waiting, Idle>;

// Requests that retype `current` into `desired`: keep the common prefix,
// delete the rest after a pause, then append the new suffix.
AnimationQueue diffAndQueue(const std::u32string& current,
                            const std::u32string& desired,
                            const AnimationTimings& timings = AnimationTimings{});

// Start running `request` on top of `baseText` at time `now`.
AnimationState applyRequest(AnimationRequest request, std::u32string baseText, Seconds now);

// Advance a Deleting/Appending state to `now`. Waiting and Idle are untouched.
// Throws std::logic_error if an append runs out of pending characters.
void update(AnimationState& state, Seconds now);

bool isFinished(const AnimationState& state, Seconds now);

// Text as of the last update.
const std::u32string& currentText(const AnimationState& state);

// Length the text will have once the state finishes.
std::size_t targetLength(const AnimationState& state);

// Settles the state at its end instant and returns the final text.
std::u32string intoFinishedString(AnimationState state);

// Elapsed share of a timed phase, clamped to [0,1].
float timeFraction(Seconds startTime, Seconds duration, Seconds now);

} // namespace ps
