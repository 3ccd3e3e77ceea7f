#pragma once
#include "ps/image/ImageLoader.hpp"
#include "ps/text/GlyphCache.hpp"
#include <glad/gl.h>

namespace ps {

// Owns one GL_TEXTURE_2D with linear filtering.
class Texture {
public:
  Texture() = default;
  ~Texture();

  Texture(const Texture&) = delete;
  Texture& operator=(const Texture&) = delete;
  Texture(Texture&& o) noexcept;
  Texture& operator=(Texture&& o) noexcept;

  // Upload a decoded PNG as RGBA. Grey expands to red only.
  bool uploadImage(const Image& image);

  // Storage without data (render targets).
  bool allocate(GLint internalFormat, int width, int height, GLenum format, GLenum type);

  GLuint id() const { return tex_; }
  int width() const { return width_; }
  int height() const { return height_; }

private:
  GLuint tex_{0};
  int width_{0};
  int height_{0};

  void create();
  void reset();
};

// Glyph bitmaps become single-channel GL_R8 textures.
class GlGlyphUploader : public GlyphUploader {
public:
  bool upload(const GlyphBitmap& bitmap, std::uint32_t& outTexture) override;
  void release(std::uint32_t texture) override;
};

} // namespace ps
