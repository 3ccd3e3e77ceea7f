#include "ps/gl/CursorRenderer.hpp"
#include <cstdio>

namespace ps {

static const char* kCursorFrag = R"GLSL(
#version 330 core
uniform vec4 u_color;
out vec4 outColor;
void main() {
    outColor = u_color;
}
)GLSL";

bool CursorRenderer::init() {
  if (!prog_.build(kScreenQuadVert, kCursorFrag)) {
    std::fprintf(stderr, "CursorRenderer::init: failed to build cursor shader\n");
    return false;
  }
  return quad_.init(prog_);
}

void CursorRenderer::setColor(float r, float g, float b, float a) {
  color_[0] = r; color_[1] = g; color_[2] = b; color_[3] = a;
}

void CursorRenderer::render(float x, float y, float width, float height, float aspect) {
  quad_.setRect(x, y, width, height);
  prog_.use();
  prog_.setUniformFloat(prog_.uniformLocation("u_aspect"), aspect);
  prog_.setUniformVec4(prog_.uniformLocation("u_color"),
                       color_[0], color_[1], color_[2], color_[3]);
  quad_.draw();
  glUseProgram(0);
}

} // namespace ps
