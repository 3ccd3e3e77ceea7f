#pragma once
#include "ps/gl/ShaderProgram.hpp"
#include "ps/mesh/VertexPacking.hpp"
#include <glad/gl.h>

namespace ps {

// Screen-space vertex stage shared by the 2D passes. Positions are in height
// units: x in [0, aspect], y in [0, 1], origin bottom-left.
extern const char* kScreenQuadVert;

// A four-vertex triangle strip in a dynamic buffer.
class ScreenQuad {
public:
  ScreenQuad() = default;
  ~ScreenQuad();

  ScreenQuad(const ScreenQuad&) = delete;
  ScreenQuad& operator=(const ScreenQuad&) = delete;

  // Binds a_position / a_uv of `prog` (those it declares).
  bool init(const ShaderProgram& prog);

  // Corner order: bottom-left, bottom-right, top-left, top-right.
  void setCorners(const QuadVertex corners[4]);
  void setRect(float x, float y, float w, float h);

  void draw() const;

private:
  GLuint vao_{0};
  GLuint vbo_{0};
};

} // namespace ps
