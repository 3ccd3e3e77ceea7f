#include "ps/text/GlyphCache.hpp"

#include <cmath>
#include <cstdio>
#include <fstream>

#define STB_TRUETYPE_IMPLEMENTATION
#include "stb_truetype.h"

namespace ps {

// SDF parameters: 8 px of padding around the outline, edge at 128, and a
// distance of one pixel moves the value by 16.
static constexpr int kSdfPadding = 8;
static constexpr unsigned char kSdfOnEdge = 128;
static constexpr float kSdfPixelDistScale = 16.0f;

GlyphCache::GlyphCache(std::uint32_t pixelSize) : pixelSize_(pixelSize) {}

GlyphCache::~GlyphCache() {
  if (!uploader_) return;
  for (auto& [cp, g] : glyphs_) {
    if (g.texture) uploader_->release(g.texture);
  }
}

bool GlyphCache::loadFont(const std::uint8_t* data, std::uint32_t len) {
  fontData_.assign(data, data + len);
  return initFont();
}

bool GlyphCache::loadFontFile(const std::string& path) {
  std::ifstream f(path, std::ios::binary | std::ios::ate);
  if (!f) {
    std::fprintf(stderr, "GlyphCache: cannot open font %s\n", path.c_str());
    return false;
  }
  auto sz = f.tellg();
  if (sz <= 0) {
    std::fprintf(stderr, "GlyphCache: empty font file %s\n", path.c_str());
    return false;
  }
  fontData_.resize(static_cast<std::size_t>(sz));
  f.seekg(0);
  f.read(reinterpret_cast<char*>(fontData_.data()), sz);
  if (!f) {
    std::fprintf(stderr, "GlyphCache: read error on %s\n", path.c_str());
    return false;
  }
  return initFont();
}

bool GlyphCache::initFont() {
  font_ = std::make_unique<stbtt_fontinfo>();
  int offset = stbtt_GetFontOffsetForIndex(fontData_.data(), 0);
  if (offset < 0 || !stbtt_InitFont(font_.get(), fontData_.data(), offset)) {
    std::fprintf(stderr, "GlyphCache: stbtt_InitFont failed\n");
    font_.reset();
    fontLoaded_ = false;
    return false;
  }
  fontLoaded_ = true;
  return true;
}

bool GlyphCache::rasterize(char32_t cp, GlyphBitmap& bitmap, CachedGlyph& metrics) const {
  if (!fontLoaded_) return false;

  // Pixel size is the em square, as with FreeType's set_pixel_sizes.
  float scale = stbtt_ScaleForMappingEmToPixels(font_.get(), static_cast<float>(pixelSize_));
  int glyph = stbtt_FindGlyphIndex(font_.get(), static_cast<int>(cp));

  int advW = 0, lsb = 0;
  stbtt_GetGlyphHMetrics(font_.get(), glyph, &advW, &lsb);
  metrics.advanceX = static_cast<int>(std::lround(static_cast<double>(advW) * scale * 64.0));

  int w = 0, h = 0, xoff = 0, yoff = 0;
  unsigned char* px = stbtt_GetGlyphSDF(font_.get(), scale, glyph, kSdfPadding, kSdfOnEdge,
                                        kSdfPixelDistScale, &w, &h, &xoff, &yoff);
  if (px) {
    metrics.sdf = true;
  } else {
    int x0, y0, x1, y1;
    stbtt_GetGlyphBitmapBox(font_.get(), glyph, scale, scale, &x0, &y0, &x1, &y1);
    if (x1 <= x0 || y1 <= y0) {
      // Whitespace: metrics only.
      metrics.left = x0;
      metrics.top = -y0;
      metrics.width = 0;
      metrics.height = 0;
      bitmap = GlyphBitmap{};
      return true;
    }
    std::fprintf(stderr, "GlyphCache: SDF rendering failed for U+%04X, using coverage bitmap\n",
                 static_cast<unsigned>(cp));
    px = stbtt_GetGlyphBitmap(font_.get(), scale, scale, glyph, &w, &h, &xoff, &yoff);
    if (!px) {
      std::fprintf(stderr, "GlyphCache: cannot rasterize U+%04X\n", static_cast<unsigned>(cp));
      return false;
    }
    metrics.sdf = false;
  }

  metrics.left = xoff;
  metrics.top = -yoff;
  metrics.width = w;
  metrics.height = h;
  bitmap.width = w;
  bitmap.height = h;
  bitmap.pixels.assign(px, px + static_cast<std::size_t>(w) * h);

  if (metrics.sdf) stbtt_FreeSDF(px, nullptr);
  else stbtt_FreeBitmap(px, nullptr);
  return true;
}

const CachedGlyph* GlyphCache::getCharacter(char32_t cp) {
  auto it = glyphs_.find(cp);
  if (it != glyphs_.end()) return &it->second;

  GlyphBitmap bitmap;
  CachedGlyph g;
  if (!rasterize(cp, bitmap, g)) return nullptr;
  rasterized_++;

  if (bitmap.width > 0 && bitmap.height > 0) {
    if (!uploader_) {
      std::fprintf(stderr, "GlyphCache: no uploader for U+%04X\n", static_cast<unsigned>(cp));
      return nullptr;
    }
    if (!uploader_->upload(bitmap, g.texture)) {
      std::fprintf(stderr, "GlyphCache: texture upload failed for U+%04X\n",
                   static_cast<unsigned>(cp));
      return nullptr;
    }
  }

  auto inserted = glyphs_.emplace(cp, g);
  return &inserted.first->second;
}

bool GlyphCache::ensureGlyphs(const std::u32string& text) {
  bool ok = true;
  for (char32_t cp : text) {
    if (cp == U'\n') continue;
    if (!getCharacter(cp)) ok = false;
  }
  return ok;
}

bool GlyphCache::ensureAscii() {
  std::u32string ascii;
  for (char32_t c = 32; c <= 126; c++) ascii.push_back(c);
  return ensureGlyphs(ascii);
}

} // namespace ps
