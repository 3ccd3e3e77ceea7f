#include "ps/gl/PostProcessRenderer.hpp"
#include <cstdio>

namespace ps {

static const char* kScanlineFrag = R"GLSL(
#version 330 core
uniform sampler2D u_screen;
uniform float u_time;
in vec2 v_uv;
out vec4 outColor;
void main() {
    vec3 c = texture(u_screen, v_uv).rgb;
    float line = 0.92 + 0.08 * sin(v_uv.y * 800.0 + u_time);
    vec2 d = v_uv - 0.5;
    float vignette = 1.0 - dot(d, d) * 0.6;
    outColor = vec4(c * line * vignette, 1.0);
}
)GLSL";

bool PostProcessRenderer::init() {
  if (!prog_.build(kScreenQuadVert, kScanlineFrag)) {
    std::fprintf(stderr, "PostProcessRenderer::init: failed to build scanline shader\n");
    return false;
  }
  return quad_.init(prog_);
}

void PostProcessRenderer::render(GLuint colorTex, float time, float aspect) {
  // Render targets are stored bottom row first, so uv runs upward here.
  const QuadVertex corners[4] = {
    {0.0f,   0.0f, 0.0f, 0.0f},
    {aspect, 0.0f, 1.0f, 0.0f},
    {0.0f,   1.0f, 0.0f, 1.0f},
    {aspect, 1.0f, 1.0f, 1.0f},
  };
  quad_.setCorners(corners);

  prog_.use();
  prog_.setUniformFloat(prog_.uniformLocation("u_aspect"), aspect);
  prog_.setUniformFloat(prog_.uniformLocation("u_time"), time * 20.0f);
  prog_.setUniformInt(prog_.uniformLocation("u_screen"), 0);

  glActiveTexture(GL_TEXTURE0);
  glBindTexture(GL_TEXTURE_2D, colorTex);
  quad_.draw();
  glBindTexture(GL_TEXTURE_2D, 0);
  glUseProgram(0);
}

} // namespace ps
