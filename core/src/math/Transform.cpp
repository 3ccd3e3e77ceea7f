#include "ps/math/Transform.hpp"
#include <cmath>

namespace ps {

float Vec3::length() const {
  return std::sqrt(x * x + y * y + z * z);
}

Vec3 Vec3::normalized() const {
  float l = length();
  if (l <= 0.0f) return *this;
  return {x / l, y / l, z / l};
}

Vec3 cross(const Vec3& a, const Vec3& b) {
  return {a.y * b.z - a.z * b.y,
          a.z * b.x - a.x * b.z,
          a.x * b.y - a.y * b.x};
}

float dot(const Vec3& a, const Vec3& b) {
  return a.x * b.x + a.y * b.y + a.z * b.z;
}

Transform Transform::identity() {
  Transform t;
  for (int i = 0; i < 4; i++) t.m[i][i] = 1.0f;
  return t;
}

Transform Transform::translation(float x, float y, float z) {
  Transform t = identity();
  t.m[0][3] = x;
  t.m[1][3] = y;
  t.m[2][3] = z;
  return t;
}

Transform Transform::scale(float x, float y, float z) {
  Transform t = identity();
  t.m[0][0] = x;
  t.m[1][1] = y;
  t.m[2][2] = z;
  return t;
}

Transform Transform::axisAngle(float angle, Axis axis) {
  float c = std::cos(angle);
  float s = std::sin(angle);
  Transform t = identity();
  switch (axis) {
    case Axis::X:
      t.m[1][1] = c;  t.m[1][2] = -s;
      t.m[2][1] = s;  t.m[2][2] = c;
      break;
    case Axis::Y:
      t.m[0][0] = c;  t.m[0][2] = s;
      t.m[2][0] = -s; t.m[2][2] = c;
      break;
    case Axis::Z:
      t.m[0][0] = c;  t.m[0][1] = -s;
      t.m[1][0] = s;  t.m[1][1] = c;
      break;
  }
  return t;
}

Transform Transform::lookAt(const Vec3& eye, const Vec3& target, const Vec3& up) {
  Vec3 forward = (target - eye).normalized();
  Vec3 right = cross(up, forward);
  if (right.length() < 1e-6f) {
    // up is parallel to the view direction; pick any perpendicular
    right = cross(Vec3{0.0f, 0.0f, 1.0f}, forward);
    if (right.length() < 1e-6f) right = cross(Vec3{1.0f, 0.0f, 0.0f}, forward);
  }
  right = right.normalized();
  Vec3 trueUp = cross(forward, right);

  Transform t = identity();
  t.m[0][0] = right.x;  t.m[0][1] = trueUp.x;  t.m[0][2] = forward.x;  t.m[0][3] = eye.x;
  t.m[1][0] = right.y;  t.m[1][1] = trueUp.y;  t.m[1][2] = forward.y;  t.m[1][3] = eye.y;
  t.m[2][0] = right.z;  t.m[2][1] = trueUp.z;  t.m[2][2] = forward.z;  t.m[2][3] = eye.z;
  return t;
}

Transform Transform::perspective(float fovY, float zNear, float zFar) {
  float f = 1.0f / std::tan(fovY * 0.5f);
  Transform t;
  t.m[0][0] = f;
  t.m[1][1] = f;
  t.m[2][2] = (zFar + zNear) / (zFar - zNear);
  t.m[2][3] = (2.0f * zFar * zNear) / (zNear - zFar);
  t.m[3][2] = 1.0f;
  return t;
}

// Determinant of the 3x3 minor left after removing `row` and `col`.
static double minor3(const Transform& t, int row, int col) {
  double a[3][3];
  int r = 0;
  for (int i = 0; i < 4; i++) {
    if (i == row) continue;
    int c = 0;
    for (int j = 0; j < 4; j++) {
      if (j == col) continue;
      a[r][c] = t.m[i][j];
      c++;
    }
    r++;
  }
  return a[0][0] * (a[1][1] * a[2][2] - a[1][2] * a[2][1])
       - a[0][1] * (a[1][0] * a[2][2] - a[1][2] * a[2][0])
       + a[0][2] * (a[1][0] * a[2][1] - a[1][1] * a[2][0]);
}

static double cofactor(const Transform& t, int row, int col) {
  double sign = ((row + col) % 2 == 0) ? 1.0 : -1.0;
  return sign * minor3(t, row, col);
}

float Transform::determinant() const {
  double det = 0.0;
  for (int j = 0; j < 4; j++) {
    det += static_cast<double>(m[0][j]) * cofactor(*this, 0, j);
  }
  return static_cast<float>(det);
}

bool Transform::invert(Transform& out) const {
  double det = 0.0;
  double cof[4][4];
  for (int i = 0; i < 4; i++) {
    for (int j = 0; j < 4; j++) {
      cof[i][j] = cofactor(*this, i, j);
    }
  }
  for (int j = 0; j < 4; j++) det += static_cast<double>(m[0][j]) * cof[0][j];
  if (std::fabs(det) < 1e-12) return false;

  // inverse = adjugate / det, adjugate = transpose of the cofactor matrix
  double invDet = 1.0 / det;
  for (int i = 0; i < 4; i++) {
    for (int j = 0; j < 4; j++) {
      out.m[i][j] = static_cast<float>(cof[j][i] * invDet);
    }
  }
  return true;
}

Transform Transform::inverted() const {
  Transform out;
  if (!invert(out)) return identity();
  return out;
}

Transform Transform::operator*(const Transform& rhs) const {
  Transform out;
  for (int row = 0; row < 4; row++) {
    for (int col = 0; col < 4; col++) {
      float sum = 0.0f;
      for (int i = 0; i < 4; i++) sum += m[row][i] * rhs.m[i][col];
      out.m[row][col] = sum;
    }
  }
  return out;
}

} // namespace ps
