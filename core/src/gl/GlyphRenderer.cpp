#include "ps/gl/GlyphRenderer.hpp"
#include "ps/text/TextLayout.hpp"
#include <cstdio>

namespace ps {

static const char* kGlyphFrag = R"GLSL(
#version 330 core
uniform sampler2D u_glyph;
uniform vec4 u_color;
uniform int u_sdf;
in vec2 v_uv;
out vec4 outColor;
void main() {
    float val = texture(u_glyph, v_uv).r;
    float a = val;
    if (u_sdf != 0) {
        float w = max(fwidth(val), 0.01);
        a = smoothstep(0.5 - w, 0.5 + w, val);
    }
    outColor = vec4(u_color.rgb, u_color.a * a);
}
)GLSL";

GlyphRenderer::GlyphRenderer(GlyphCache& cache) : cache_(cache) {}

bool GlyphRenderer::init() {
  if (!prog_.build(kScreenQuadVert, kGlyphFrag)) {
    std::fprintf(stderr, "GlyphRenderer::init: failed to build glyph shader\n");
    return false;
  }
  if (!quad_.init(prog_)) {
    std::fprintf(stderr, "GlyphRenderer::init: failed to create quad buffer\n");
    return false;
  }
  return true;
}

float GlyphRenderer::scale() const {
  return 1.0f / 32.0f / static_cast<float>(cache_.pixelSize());
}

float GlyphRenderer::lineHeight() const {
  return 400.0f * scale();
}

void GlyphRenderer::setColor(float r, float g, float b, float a) {
  color_[0] = r; color_[1] = g; color_[2] = b; color_[3] = a;
}

GlyphDrawResult GlyphRenderer::render(const std::u32string& text, float x, float y, float aspect) {
  TextLayoutParams params;
  params.scale = scale();
  params.lineHeight = lineHeight();
  params.rightEdge = aspect;

  TextLayoutResult placed = layoutText(text, x, y, params,
      [this](char32_t cp) { return cache_.getCharacter(cp); });

  GlyphDrawResult r;
  r.advanceX = placed.advanceX;
  r.advanceY = placed.advanceY;
  if (placed.quads.empty()) return r;

  prog_.use();
  prog_.setUniformFloat(prog_.uniformLocation("u_aspect"), aspect);
  prog_.setUniformVec4(prog_.uniformLocation("u_color"),
                       color_[0], color_[1], color_[2], color_[3]);
  prog_.setUniformInt(prog_.uniformLocation("u_glyph"), 0);
  GLint uSdf = prog_.uniformLocation("u_sdf");
  glActiveTexture(GL_TEXTURE0);

  for (const auto& q : placed.quads) {
    if (!q.glyph->texture) continue;
    quad_.setRect(q.x, q.y, q.w, q.h);
    prog_.setUniformInt(uSdf, q.glyph->sdf ? 1 : 0);
    glBindTexture(GL_TEXTURE_2D, q.glyph->texture);
    quad_.draw();
    r.quads++;
  }

  glBindTexture(GL_TEXTURE_2D, 0);
  glUseProgram(0);
  return r;
}

} // namespace ps
