#include "ps/text/TextLayout.hpp"

namespace ps {

TextLayoutResult layoutText(const std::u32string& text, float originX, float originY,
                            const TextLayoutParams& params, const GlyphLookup& lookup) {
  TextLayoutResult r;
  float advance = 0.0f;
  float advanceY = 0.0f;
  const float scale = params.scale;

  std::size_t i = 0;
  while (i < text.size()) {
    char32_t cp = text[i];

    if (cp == U'\n') {
      advanceY -= params.lineHeight;
      advance = 0.0f;
      r.lines++;
      i++;
      continue;
    }

    const CachedGlyph* g = lookup ? lookup(cp) : nullptr;
    if (!g) {
      i++;
      continue;
    }

    float x = originX + advance + static_cast<float>(g->left) * scale;
    float y = originY + advanceY + static_cast<float>(g->top - g->height) * scale;
    float w = static_cast<float>(g->width) * scale;
    float h = static_cast<float>(g->height) * scale;

    if (x + w > params.rightEdge && advance > 0.0f) {
      // Retry the same character on a fresh line.
      advanceY -= params.lineHeight;
      advance = 0.0f;
      r.lines++;
      continue;
    }

    if (g->width > 0 && g->height > 0) {
      r.quads.push_back(PlacedGlyph{cp, g, x, y, w, h});
    }
    advance += static_cast<float>(g->advanceX) / 64.0f * scale;
    i++;
  }

  r.advanceX = advance;
  r.advanceY = advanceY;
  return r;
}

} // namespace ps
