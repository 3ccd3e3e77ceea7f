#pragma once
#include "ps/anim/CursorBlink.hpp"
#include "ps/anim/TextAnimator.hpp"
#include "ps/app/SceneConfig.hpp"
#include "ps/gl/Renderer.hpp"

namespace ps {

// Per-frame state of the pre-stream screen: the typed banner, the caret and
// the orbiting camera. Owns no GL objects; frame() feeds Renderer::render.
class StreamScreen {
public:
  StreamScreen(const SceneConfig& cfg, TextAnimator::TargetProvider provider, Seconds start);

  void update(Seconds now);

  FrameInput frame(float aspect) const;

  const TextAnimator& animator() const { return animator_; }
  const CursorBlink& cursor() const { return cursor_; }
  double cameraTime() const { return time_; }

private:
  SceneConfig cfg_;
  TextAnimator animator_;
  CursorBlink cursor_;
  Seconds lastUpdate_;
  double time_{0};
};

// Durations taken from the config.
AnimationTimings timingsFromConfig(const SceneConfig& cfg);

} // namespace ps
