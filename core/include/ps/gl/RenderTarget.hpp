#pragma once
#include "ps/gl/Texture.hpp"
#include <glad/gl.h>

namespace ps {

// Depth-only framebuffer for the shadow pass. Created once, reused per frame.
class DepthTarget {
public:
  DepthTarget() = default;
  ~DepthTarget();

  DepthTarget(const DepthTarget&) = delete;
  DepthTarget& operator=(const DepthTarget&) = delete;

  bool init(int size);

  // Bind the framebuffer and set the viewport to the full map.
  void bind() const;

  GLuint texture() const { return depth_.id(); }
  int size() const { return size_; }

private:
  GLuint fbo_{0};
  Texture depth_;
  int size_{0};
};

// Offscreen colour + depth framebuffer feeding the post-process pass.
class ColorTarget {
public:
  ColorTarget() = default;
  ~ColorTarget();

  ColorTarget(const ColorTarget&) = delete;
  ColorTarget& operator=(const ColorTarget&) = delete;

  bool init(int width, int height);
  void bind() const;

  GLuint texture() const { return color_.id(); }

private:
  GLuint fbo_{0};
  GLuint depthRb_{0};
  Texture color_;
  int width_{0};
  int height_{0};
};

} // namespace ps
