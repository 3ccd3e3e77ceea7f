#include "ps/anim/TextAnimation.hpp"
#include "ps/math/Ease.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace ps {

namespace {

template <class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

float easedFraction(Seconds startTime, Seconds duration, Seconds now) {
  float t = timeFraction(startTime, duration, now);
  // Pin the end point so floor() lands exactly on the target length.
  return t >= 1.0f ? 1.0f : easeInSine(t);
}

void updateDeleting(Deleting& d, Seconds now) {
  float eased = easedFraction(d.startTime, d.duration, now);
  auto span = static_cast<float>(d.startLen - d.desiredLen);
  auto deleted = static_cast<std::size_t>(std::floor(span * eased));
  std::size_t len = d.startLen - deleted;
  if (d.text.size() > len) d.text.resize(len);
}

void updateAppending(Appending& a, Seconds now) {
  float eased = easedFraction(a.startTime, a.duration, now);
  std::size_t finalLen = a.text.size() + a.pending.size();
  auto span = static_cast<float>(finalLen - a.startLen);
  std::size_t desiredLen = a.startLen + static_cast<std::size_t>(std::floor(span * eased));

  while (a.text.size() < desiredLen) {
    if (a.pending.empty()) {
      throw std::logic_error("TextAnimation: append ran out of pending characters");
    }
    a.text.push_back(a.pending.front());
    a.pending.pop_front();
  }
}

} // namespace

float timeFraction(Seconds startTime, Seconds duration, Seconds now) {
  if (duration <= 0.0) return 1.0f;
  double t = (now - startTime) / duration;
  return static_cast<float>(std::clamp(t, 0.0, 1.0));
}

AnimationQueue diffAndQueue(const std::u32string& current,
                            const std::u32string& desired,
                            const AnimationTimings& timings) {
  std::size_t firstDiff = 0;
  std::size_t common = std::min(current.size(), desired.size());
  bool differs = false;
  for (std::size_t i = 0; i < common; i++) {
    if (current[i] != desired[i]) {
      firstDiff = i;
      differs = true;
      break;
    }
  }
  // No differing position among the shared characters: one is a prefix of the
  // other, and everything past the shorter one is the difference.
  if (!differs) firstDiff = common;

  // A strict prefix only needs its missing tail typed.
  bool extendsCurrent = !differs && current.size() < desired.size();

  AnimationQueue q;
  if (!current.empty() && !extendsCurrent) {
    q.push_back(WaitRequest{timings.wait});
    q.push_back(DeleteRequest{firstDiff, timings.erase});
  }
  q.push_back(AppendRequest{desired.substr(firstDiff), timings.append});
  return q;
}

AnimationState applyRequest(AnimationRequest request, std::u32string baseText, Seconds now) {
  std::size_t baseLen = baseText.size();
  return std::visit(Overloaded{
    [&](DeleteRequest& r) -> AnimationState {
      Deleting d;
      d.desiredLen = std::min(r.desiredLen, baseLen);
      d.startLen = baseLen;
      d.text = std::move(baseText);
      d.startTime = now;
      d.duration = r.duration;
      return d;
    },
    [&](AppendRequest& r) -> AnimationState {
      Appending a;
      a.startLen = baseLen;
      a.text = std::move(baseText);
      a.pending.assign(r.chars.begin(), r.chars.end());
      a.startTime = now;
      a.duration = r.duration;
      return a;
    },
    [&](WaitRequest& r) -> AnimationState {
      return Waiting{std::move(baseText), now + r.duration};
    },
  }, request);
}

void update(AnimationState& state, Seconds now) {
  std::visit(Overloaded{
    [&](Deleting& d) { updateDeleting(d, now); },
    [&](Appending& a) { updateAppending(a, now); },
    [](Waiting&) {},
    [](Idle&) {},
  }, state);
}

bool isFinished(const AnimationState& state, Seconds now) {
  return std::visit(Overloaded{
    [&](const Deleting& d) { return timeFraction(d.startTime, d.duration, now) >= 1.0f; },
    [&](const Appending& a) { return timeFraction(a.startTime, a.duration, now) >= 1.0f; },
    [&](const Waiting& w) { return now > w.endTime; },
    [](const Idle&) { return true; },
  }, state);
}

const std::u32string& currentText(const AnimationState& state) {
  return std::visit([](const auto& s) -> const std::u32string& { return s.text; }, state);
}

std::size_t targetLength(const AnimationState& state) {
  return std::visit(Overloaded{
    [](const Deleting& d) { return d.desiredLen; },
    [](const Appending& a) { return a.startLen + (a.text.size() - a.startLen) + a.pending.size(); },
    [](const Waiting& w) { return w.text.size(); },
    [](const Idle& i) { return i.text.size(); },
  }, state);
}

std::u32string intoFinishedString(AnimationState state) {
  return std::visit(Overloaded{
    [](Deleting& d) {
      updateDeleting(d, d.startTime + d.duration);
      return std::move(d.text);
    },
    [](Appending& a) {
      updateAppending(a, a.startTime + a.duration);
      return std::move(a.text);
    },
    [](Waiting& w) { return std::move(w.text); },
    [](Idle& i) { return std::move(i.text); },
  }, state);
}

} // namespace ps
