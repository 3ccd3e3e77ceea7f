#include "ps/app/StreamScreen.hpp"
#include "ps/scene/Camera.hpp"

#include <utility>

namespace ps {

AnimationTimings timingsFromConfig(const SceneConfig& cfg) {
  AnimationTimings t;
  t.wait = cfg.waitSeconds;
  t.erase = cfg.deleteSeconds;
  t.append = cfg.appendSeconds;
  return t;
}

StreamScreen::StreamScreen(const SceneConfig& cfg, TextAnimator::TargetProvider provider,
                           Seconds start)
  : cfg_(cfg),
    animator_(std::move(provider), timingsFromConfig(cfg)),
    cursor_(cfg.cursorBlinkSeconds, start),
    lastUpdate_(start) {
  animator_.reset(std::u32string{});
}

void StreamScreen::update(Seconds now) {
  animator_.tick(now);
  cursor_.update(now);
  time_ += now - lastUpdate_;
  lastUpdate_ = now;
}

FrameInput StreamScreen::frame(float aspect) const {
  FrameInput f;
  Vec3 lightDir{cfg_.lightDir[0], cfg_.lightDir[1], cfg_.lightDir[2]};
  f.view = viewMatrix(static_cast<float>(time_ * cfg_.cameraSpin), aspect);
  f.light = lightTransform(lightDir);
  f.lightDir = lightDir;
  for (int i = 0; i < 3; i++) f.lightColor[i] = cfg_.lightColor[i];
  f.text = animator_.text();
  f.textX = cfg_.textOrigin[0];
  f.textY = cfg_.textOrigin[1];
  f.cursorVisible = cursor_.visible();
  f.time = static_cast<float>(time_);
  return f;
}

} // namespace ps
