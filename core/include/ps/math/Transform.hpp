#pragma once

namespace ps {

struct Vec3 {
  float x{0}, y{0}, z{0};

  float length() const;
  Vec3 normalized() const;

  Vec3 operator-(const Vec3& o) const { return {x - o.x, y - o.y, z - o.z}; }
};

Vec3 cross(const Vec3& a, const Vec3& b);
float dot(const Vec3& a, const Vec3& b);

enum class Axis { X, Y, Z };

// 4x4 matrix, row-major: m[row][col]. Points are column vectors, so
// (A * B) applied to p is A(B(p)). Upload with transpose = GL_TRUE.
struct Transform {
  float m[4][4] = {{0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}};

  static Transform identity();
  static Transform translation(float x, float y, float z);
  static Transform scale(float x, float y, float z);
  static Transform axisAngle(float angle, Axis axis);

  // Camera-to-world placement of a camera at `eye` looking at `target`.
  // Cameras look down their local +Z. Invert it to get a view matrix.
  static Transform lookAt(const Vec3& eye, const Vec3& target, const Vec3& up);

  // Square-aspect projection looking down +Z: zNear maps to -1, zFar to +1.
  // Apply aspect with a separate scale.
  static Transform perspective(float fovY, float zNear, float zFar);

  float determinant() const;

  // Adjugate / determinant. Returns false and leaves `out` untouched for a
  // singular matrix.
  bool invert(Transform& out) const;

  // Singular matrices yield the identity.
  Transform inverted() const;

  Transform operator*(const Transform& rhs) const;

  const float* data() const { return &m[0][0]; }
};

} // namespace ps
