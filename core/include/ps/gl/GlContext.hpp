#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace ps {

// A current GL 3.3 core context with entry points loaded through glad.
class GlContext {
public:
  virtual ~GlContext() = default;

  // Returns false on failure and keeps the reason in lastError().
  virtual bool init(int width, int height) = 0;
  virtual void swapBuffers() = 0;

  int width() const { return width_; }
  int height() const { return height_; }
  const std::string& lastError() const { return lastError_; }

  // RGBA8 pixels of the default framebuffer, bottom row first. Any
  // offscreen target left bound by the renderer is ignored.
  std::vector<std::uint8_t> readPixels() const;

protected:
  // Records the reason, prints "<owner>: <reason>" and returns false.
  bool fail(const char* owner, std::string reason);

  int width_{0};
  int height_{0};
  std::string lastError_;
};

} // namespace ps
