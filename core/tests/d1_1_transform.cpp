// D1.1: Transform multiplication, inversion, look-at and projection.

#include "ps/math/Transform.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireNear(float a, float b, float eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.6f, expected %.6f)\n", msg, a, b);
    std::exit(1);
  }
}

static void requireIdentity(const ps::Transform& t, float eps, const char* msg) {
  for (int r = 0; r < 4; r++)
    for (int c = 0; c < 4; c++)
      requireNear(t.m[r][c], r == c ? 1.0f : 0.0f, eps, msg);
}

struct Vec4 { float x, y, z, w; };

static Vec4 apply(const ps::Transform& t, float x, float y, float z) {
  float in[4] = {x, y, z, 1.0f};
  float out[4] = {0, 0, 0, 0};
  for (int r = 0; r < 4; r++)
    for (int c = 0; c < 4; c++)
      out[r] += t.m[r][c] * in[c];
  return {out[0], out[1], out[2], out[3]};
}

int main() {
  // Test 1: plain row-by-column product
  {
    ps::Transform a;
    ps::Transform b;
    const float av[4][4] = {{1, 2, 3, 4}, {5, 6, 7, 8}, {9, 0, 1, 2}, {3, 4, 5, 6}};
    const float bv[4][4] = {{2, 3, 4, 5}, {6, 7, 8, 9}, {10, 1, 2, 3}, {4, 5, 6, 7}};
    for (int r = 0; r < 4; r++)
      for (int c = 0; c < 4; c++) { a.m[r][c] = av[r][c]; b.m[r][c] = bv[r][c]; }

    ps::Transform c = a * b;
    const float expected[4][4] = {
      {60, 40, 50, 60}, {148, 104, 130, 156}, {36, 38, 50, 62}, {104, 72, 90, 108}};
    for (int r = 0; r < 4; r++)
      for (int col = 0; col < 4; col++)
        requireNear(c.m[r][col], expected[r][col], 0.001f, "product element");
    std::printf("Test 1 (multiply): PASS\n");
  }

  // Test 2: right-to-left application
  {
    ps::Transform t = ps::Transform::translation(1, 0, 0) * ps::Transform::scale(2, 2, 2);
    Vec4 p = apply(t, 1, 1, 1);
    requireNear(p.x, 3.0f, 1e-6f, "scale then translate x");
    requireNear(p.y, 2.0f, 1e-6f, "scale then translate y");
    requireNear(p.w, 1.0f, 1e-6f, "w preserved");
    std::printf("Test 2 (composition order): PASS\n");
  }

  // Test 3: inverse of a rigid + scale transform
  {
    ps::Transform t = ps::Transform::translation(1, 2, 3)
                    * ps::Transform::axisAngle(0.7f, ps::Axis::Y)
                    * ps::Transform::axisAngle(-0.3f, ps::Axis::X)
                    * ps::Transform::scale(2, 3, 4);
    ps::Transform inv;
    requireTrue(t.invert(inv), "invertible");
    requireIdentity(t * inv, 1e-4f, "T * T^-1 == I");
    requireIdentity(inv * t, 1e-4f, "T^-1 * T == I");
    requireNear(t.determinant(), 24.0f, 1e-3f, "det = product of scales");
    std::printf("Test 3 (inverse): PASS\n");
  }

  // Test 4: inverse of a projective matrix
  {
    ps::Transform p = ps::Transform::perspective(1.2f, 0.1f, 10.0f);
    requireIdentity(p * p.inverted(), 1e-3f, "perspective * inverse");
    std::printf("Test 4 (projective inverse): PASS\n");
  }

  // Test 5: singular matrices
  {
    ps::Transform s = ps::Transform::scale(0, 1, 1);
    ps::Transform out = ps::Transform::translation(5, 5, 5);
    requireTrue(!s.invert(out), "singular not invertible");
    requireNear(out.m[0][3], 5.0f, 0.0f, "out untouched");
    requireIdentity(s.inverted(), 0.0f, "inverted() falls back to identity");
    std::printf("Test 5 (singular): PASS\n");
  }

  // Test 6: look-at places the camera and aims +Z at the target
  {
    ps::Transform l = ps::Transform::lookAt({0, 0, 0}, {0, 0, 5}, {0, 1, 0});
    requireIdentity(l, 1e-6f, "look down +Z from origin");

    ps::Transform cam = ps::Transform::lookAt({1, 2, 3}, {4, 2, 3}, {0, 1, 0});
    Vec4 eye = apply(cam, 0, 0, 0);
    requireNear(eye.x, 1.0f, 1e-5f, "eye x");
    requireNear(eye.y, 2.0f, 1e-5f, "eye y");
    requireNear(eye.z, 3.0f, 1e-5f, "eye z");
    Vec4 t = apply(cam.inverted(), 4, 2, 3);
    requireNear(t.x, 0.0f, 1e-5f, "target on axis x");
    requireNear(t.y, 0.0f, 1e-5f, "target on axis y");
    requireNear(t.z, 3.0f, 1e-5f, "target 3 units ahead");
    requireNear(cam.determinant(), 1.0f, 1e-5f, "proper rotation");

    // up parallel to the view direction still yields an orthonormal frame
    ps::Transform down = ps::Transform::lookAt({0, 0, 0}, {0, -1, 0}, {0, 1, 0});
    requireNear(down.determinant(), 1.0f, 1e-5f, "fallback frame is a rotation");
    Vec4 below = apply(down.inverted(), 0, -2, 0);
    requireNear(below.z, 2.0f, 1e-5f, "point below is ahead");
    std::printf("Test 6 (look-at): PASS\n");
  }

  // Test 7: projection maps near/far to -1/+1
  {
    ps::Transform p = ps::Transform::perspective(1.5707963f, 0.1f, 10.0f);
    Vec4 n = apply(p, 0, 0, 0.1f);
    Vec4 f = apply(p, 0, 0, 10.0f);
    requireNear(n.z / n.w, -1.0f, 1e-4f, "near plane");
    requireNear(f.z / f.w, 1.0f, 1e-4f, "far plane");
    Vec4 edge = apply(p, 1, 0, 1);
    requireNear(edge.x / edge.w, 1.0f, 1e-4f, "90 degree fov edge");
    std::printf("Test 7 (perspective): PASS\n");
  }

  // Test 8: axis rotations
  {
    Vec4 p = apply(ps::Transform::axisAngle(1.5707963f, ps::Axis::Z), 1, 0, 0);
    requireNear(p.x, 0.0f, 1e-6f, "z rot x");
    requireNear(p.y, 1.0f, 1e-6f, "z rot y");
    p = apply(ps::Transform::axisAngle(1.5707963f, ps::Axis::X), 0, 1, 0);
    requireNear(p.z, 1.0f, 1e-6f, "x rot y->z");
    p = apply(ps::Transform::axisAngle(1.5707963f, ps::Axis::Y), 0, 0, 1);
    requireNear(p.x, 1.0f, 1e-6f, "y rot z->x");
    std::printf("Test 8 (axis angle): PASS\n");
  }

  std::printf("\nAll transform tests passed.\n");
  return 0;
}
