#pragma once
#include "ps/gl/ScreenQuad.hpp"
#include "ps/gl/ShaderProgram.hpp"

namespace ps {

// Solid block cursor in the glyph coordinate space.
class CursorRenderer {
public:
  bool init();

  void setColor(float r, float g, float b, float a);
  void render(float x, float y, float width, float height, float aspect);

private:
  ShaderProgram prog_;
  ScreenQuad quad_;
  float color_[4] = {0.9f, 0.9f, 0.9f, 1.0f};
};

} // namespace ps
