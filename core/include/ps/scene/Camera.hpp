#pragma once
#include "ps/math/Transform.hpp"

namespace ps {

// World -> light clip space for an orthographic light shining along
// `lightDir` from the origin.
Transform lightTransform(const Vec3& lightDir);

// Perspective camera orbiting the desk: yaw by `yaw` radians, pitched down
// 0.5 rad, 1.5 units back. `aspect` is width / height.
Transform viewMatrix(float yaw, float aspect);

// Camera clip space -> light clip space.
Transform viewToLight(const Transform& light, const Transform& view);

// Model placements.
Transform tableModel();
Transform monitorModel();  // also used for the screen

} // namespace ps
