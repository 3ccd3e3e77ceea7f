#pragma once
#include "ps/text/GlyphCache.hpp"

#include <functional>
#include <string>
#include <vector>

namespace ps {

struct TextLayoutParams {
  float scale{1.0f};       // glyph pixels -> layout units
  float lineHeight{1.0f};  // layout units
  float rightEdge{1.0f};   // x at which a glyph no longer fits
};

struct PlacedGlyph {
  char32_t codepoint{0};
  const CachedGlyph* glyph{nullptr};
  float x{0}, y{0}, w{0}, h{0};  // quad, (x,y) is bottom-left
};

struct TextLayoutResult {
  std::vector<PlacedGlyph> quads;  // only glyphs with pixels
  float advanceX{0};               // pen offset from the origin after the text
  float advanceY{0};               // negative: lines go down
  int lines{1};
};

using GlyphLookup = std::function<const CachedGlyph*(char32_t)>;

// Places `text` starting at pen (originX, originY), y up. '\n' starts a new
// line. A glyph that would cross rightEdge moves to a new line and is placed
// there instead; at the start of a line it is placed regardless so that every
// character makes progress. Code points the lookup cannot provide are skipped.
TextLayoutResult layoutText(const std::u32string& text, float originX, float originY,
                            const TextLayoutParams& params, const GlyphLookup& lookup);

} // namespace ps
