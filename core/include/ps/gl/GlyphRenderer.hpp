#pragma once
#include "ps/gl/ScreenQuad.hpp"
#include "ps/gl/ShaderProgram.hpp"
#include "ps/text/GlyphCache.hpp"
#include <string>

namespace ps {

struct GlyphDrawResult {
  float advanceX{0};  // pen offset after the text, screen height units
  float advanceY{0};
  std::uint32_t quads{0};
};

// Draws text one glyph quad at a time from a GlyphCache. Glyph outlines are
// sampled as signed distance fields where the cache produced them.
class GlyphRenderer {
public:
  explicit GlyphRenderer(GlyphCache& cache);

  bool init();

  // Glyph pixels -> screen height units.
  float scale() const;
  float lineHeight() const;

  void setColor(float r, float g, float b, float a);

  // Pen starts at (x, y); the line wraps at x = aspect.
  GlyphDrawResult render(const std::u32string& text, float x, float y, float aspect);

private:
  GlyphCache& cache_;
  ShaderProgram prog_;
  ScreenQuad quad_;
  float color_[4] = {0.9f, 0.9f, 0.9f, 1.0f};
};

} // namespace ps
