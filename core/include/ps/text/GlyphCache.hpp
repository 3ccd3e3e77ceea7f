#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

struct stbtt_fontinfo;

namespace ps {

// Single-channel glyph image, rows top to bottom.
struct GlyphBitmap {
  int width{0};
  int height{0};
  std::vector<std::uint8_t> pixels;
};

struct CachedGlyph {
  std::uint32_t texture{0};  // 0 when the glyph has no pixels (e.g. space)
  int advanceX{0};           // 1/64 pixel units
  int left{0};               // pen to bitmap left edge, pixels
  int top{0};                // baseline to bitmap top edge, pixels (up is +)
  int width{0};
  int height{0};
  bool sdf{false};
};

// Receives rasterized glyphs and turns them into texture handles.
class GlyphUploader {
public:
  virtual ~GlyphUploader() = default;
  virtual bool upload(const GlyphBitmap& bitmap, std::uint32_t& outTexture) = 0;
  virtual void release(std::uint32_t texture) = 0;
};

// Memoizes rasterized + uploaded glyphs per code point. Entries live until the
// cache is destroyed, which releases every texture through the uploader.
class GlyphCache {
public:
  explicit GlyphCache(std::uint32_t pixelSize);
  ~GlyphCache();

  GlyphCache(const GlyphCache&) = delete;
  GlyphCache& operator=(const GlyphCache&) = delete;

  bool loadFont(const std::uint8_t* data, std::uint32_t len);
  bool loadFontFile(const std::string& path);

  // Must outlive the cache.
  void setUploader(GlyphUploader* uploader) { uploader_ = uploader; }

  std::uint32_t pixelSize() const { return pixelSize_; }

  // Looks up or rasterizes+uploads `cp`. nullptr on failure (logged).
  const CachedGlyph* getCharacter(char32_t cp);

  // Fetch every code point of `text` now. False if any glyph failed.
  bool ensureGlyphs(const std::u32string& text);

  // Printable ASCII (32..126).
  bool ensureAscii();

  std::size_t size() const { return glyphs_.size(); }
  std::uint64_t rasterizeCount() const { return rasterized_; }

  // Rasterize without caching or uploading.
  bool rasterize(char32_t cp, GlyphBitmap& bitmap, CachedGlyph& metrics) const;

private:
  std::uint32_t pixelSize_;
  std::vector<std::uint8_t> fontData_;
  std::unique_ptr<stbtt_fontinfo> font_;
  bool fontLoaded_{false};
  GlyphUploader* uploader_{nullptr};
  std::unordered_map<char32_t, CachedGlyph> glyphs_;
  std::uint64_t rasterized_{0};

  bool initFont();
};

} // namespace ps
