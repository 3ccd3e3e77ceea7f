#include "ps/gl/RenderTarget.hpp"
#include <cstdio>

namespace ps {

static bool checkComplete(const char* who) {
  GLenum status = glCheckFramebufferStatus(GL_FRAMEBUFFER);
  if (status != GL_FRAMEBUFFER_COMPLETE) {
    std::fprintf(stderr, "%s: incomplete framebuffer (0x%x)\n", who, status);
    return false;
  }
  return true;
}

DepthTarget::~DepthTarget() {
  if (fbo_) glDeleteFramebuffers(1, &fbo_);
}

bool DepthTarget::init(int size) {
  if (!depth_.allocate(GL_DEPTH_COMPONENT24, size, size, GL_DEPTH_COMPONENT, GL_FLOAT)) {
    return false;
  }

  glGenFramebuffers(1, &fbo_);
  glBindFramebuffer(GL_FRAMEBUFFER, fbo_);
  glFramebufferTexture2D(GL_FRAMEBUFFER, GL_DEPTH_ATTACHMENT, GL_TEXTURE_2D, depth_.id(), 0);
  glDrawBuffer(GL_NONE);
  glReadBuffer(GL_NONE);
  bool ok = checkComplete("DepthTarget");
  glBindFramebuffer(GL_FRAMEBUFFER, 0);

  size_ = size;
  return ok;
}

void DepthTarget::bind() const {
  glBindFramebuffer(GL_FRAMEBUFFER, fbo_);
  glViewport(0, 0, size_, size_);
}

ColorTarget::~ColorTarget() {
  if (depthRb_) glDeleteRenderbuffers(1, &depthRb_);
  if (fbo_) glDeleteFramebuffers(1, &fbo_);
}

bool ColorTarget::init(int width, int height) {
  if (!color_.allocate(GL_RGB8, width, height, GL_RGB, GL_UNSIGNED_BYTE)) {
    return false;
  }

  glGenRenderbuffers(1, &depthRb_);
  glBindRenderbuffer(GL_RENDERBUFFER, depthRb_);
  glRenderbufferStorage(GL_RENDERBUFFER, GL_DEPTH_COMPONENT24, width, height);
  glBindRenderbuffer(GL_RENDERBUFFER, 0);

  glGenFramebuffers(1, &fbo_);
  glBindFramebuffer(GL_FRAMEBUFFER, fbo_);
  glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, color_.id(), 0);
  glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_DEPTH_ATTACHMENT, GL_RENDERBUFFER, depthRb_);
  GLenum buffers[1] = {GL_COLOR_ATTACHMENT0};
  glDrawBuffers(1, buffers);
  bool ok = checkComplete("ColorTarget");
  glBindFramebuffer(GL_FRAMEBUFFER, 0);

  width_ = width;
  height_ = height;
  return ok;
}

void ColorTarget::bind() const {
  glBindFramebuffer(GL_FRAMEBUFFER, fbo_);
  glViewport(0, 0, width_, height_);
}

} // namespace ps
