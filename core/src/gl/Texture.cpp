#include "ps/gl/Texture.hpp"
#include <cstdio>

namespace ps {

Texture::~Texture() {
  reset();
}

Texture::Texture(Texture&& o) noexcept
  : tex_(o.tex_), width_(o.width_), height_(o.height_) {
  o.tex_ = 0;
}

Texture& Texture::operator=(Texture&& o) noexcept {
  if (this != &o) {
    reset();
    tex_ = o.tex_;
    width_ = o.width_;
    height_ = o.height_;
    o.tex_ = 0;
  }
  return *this;
}

void Texture::reset() {
  if (tex_) {
    glDeleteTextures(1, &tex_);
    tex_ = 0;
  }
}

void Texture::create() {
  if (!tex_) glGenTextures(1, &tex_);
  glBindTexture(GL_TEXTURE_2D, tex_);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
}

bool Texture::uploadImage(const Image& image) {
  GLenum format = GL_RGBA;
  switch (image.format) {
    case PixelFormat::Grey: format = GL_RED; break;
    case PixelFormat::Rgb:  format = GL_RGB; break;
    case PixelFormat::Rgba: format = GL_RGBA; break;
  }
  GLenum type = image.bitDepth == 16 ? GL_UNSIGNED_SHORT : GL_UNSIGNED_BYTE;

  std::size_t expected = static_cast<std::size_t>(image.width) * image.height *
                         image.channels() * (image.bitDepth / 8);
  if (image.width <= 0 || image.height <= 0 || image.pixels.size() < expected) {
    std::fprintf(stderr, "Texture: image %dx%d has %zu bytes, expected %zu\n",
                 image.width, image.height, image.pixels.size(), expected);
    return false;
  }

  create();
  glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
  glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, image.width, image.height, 0,
               format, type, image.pixels.data());
  glBindTexture(GL_TEXTURE_2D, 0);

  GLenum err = glGetError();
  if (err != GL_NO_ERROR) {
    std::fprintf(stderr, "Texture: glTexImage2D failed (0x%x)\n", err);
    return false;
  }
  width_ = image.width;
  height_ = image.height;
  return true;
}

bool Texture::allocate(GLint internalFormat, int width, int height, GLenum format, GLenum type) {
  create();
  glTexImage2D(GL_TEXTURE_2D, 0, internalFormat, width, height, 0, format, type, nullptr);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
  glBindTexture(GL_TEXTURE_2D, 0);

  GLenum err = glGetError();
  if (err != GL_NO_ERROR) {
    std::fprintf(stderr, "Texture: %dx%d allocation failed (0x%x)\n", width, height, err);
    return false;
  }
  width_ = width;
  height_ = height;
  return true;
}

bool GlGlyphUploader::upload(const GlyphBitmap& bitmap, std::uint32_t& outTexture) {
  GLuint tex = 0;
  glGenTextures(1, &tex);
  glBindTexture(GL_TEXTURE_2D, tex);
  glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
  glTexImage2D(GL_TEXTURE_2D, 0, GL_R8, bitmap.width, bitmap.height, 0,
               GL_RED, GL_UNSIGNED_BYTE, bitmap.pixels.data());
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
  glBindTexture(GL_TEXTURE_2D, 0);

  GLenum err = glGetError();
  if (err != GL_NO_ERROR) {
    std::fprintf(stderr, "GlGlyphUploader: upload of %dx%d glyph failed (0x%x)\n",
                 bitmap.width, bitmap.height, err);
    glDeleteTextures(1, &tex);
    return false;
  }
  outTexture = tex;
  return true;
}

void GlGlyphUploader::release(std::uint32_t texture) {
  GLuint tex = texture;
  glDeleteTextures(1, &tex);
}

} // namespace ps
