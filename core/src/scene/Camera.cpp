#include "ps/scene/Camera.hpp"

namespace ps {

static constexpr float kFovY = 1.5707963267948966f;  // 90 degrees
static constexpr float kNear = 0.1f;
static constexpr float kFar = 10.0f;

Transform lightTransform(const Vec3& lightDir) {
  Transform place = Transform::lookAt(Vec3{0.0f, 0.0f, 0.0f}, lightDir, Vec3{0.0f, 1.0f, 0.0f});
  return Transform::scale(1.0f, 0.5f, 0.1f) * place.inverted();
}

Transform viewMatrix(float yaw, float aspect) {
  Transform camera = Transform::axisAngle(yaw, Axis::Y)
                   * Transform::axisAngle(0.5f, Axis::X)
                   * Transform::translation(0.0f, 0.0f, -1.5f);
  return Transform::scale(1.0f / aspect, 1.0f, 1.0f)
       * Transform::perspective(kFovY, kNear, kFar)
       * camera.inverted();
}

Transform viewToLight(const Transform& light, const Transform& view) {
  return light * view.inverted();
}

Transform tableModel() {
  return Transform::identity();
}

Transform monitorModel() {
  return Transform::translation(0.0f, 0.08f, 0.0f) * Transform::scale(1.5f, 1.5f, 1.5f);
}

} // namespace ps
