#include "ps/gl/GlContext.hpp"
#include <glad/gl.h>
#include <cstdio>
#include <utility>

namespace ps {

std::vector<std::uint8_t> GlContext::readPixels() const {
  std::vector<std::uint8_t> pixels(static_cast<std::size_t>(width_) * height_ * 4);
  if (pixels.empty()) return pixels;

  glBindFramebuffer(GL_READ_FRAMEBUFFER, 0);
  glPixelStorei(GL_PACK_ALIGNMENT, 1);
  glReadPixels(0, 0, width_, height_, GL_RGBA, GL_UNSIGNED_BYTE, pixels.data());
  return pixels;
}

bool GlContext::fail(const char* owner, std::string reason) {
  lastError_ = std::move(reason);
  std::fprintf(stderr, "%s: %s\n", owner, lastError_.c_str());
  return false;
}

} // namespace ps
