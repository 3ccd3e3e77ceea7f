#pragma once
#include "ps/gl/ScreenQuad.hpp"
#include "ps/gl/ShaderProgram.hpp"

namespace ps {

// Copies an offscreen colour texture to the bound framebuffer with a rolling
// scanline effect.
class PostProcessRenderer {
public:
  bool init();

  void render(GLuint colorTex, float time, float aspect);

private:
  ShaderProgram prog_;
  ScreenQuad quad_;
};

} // namespace ps
