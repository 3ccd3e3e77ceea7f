#pragma once
#include "ps/gl/GlContext.hpp"
#include <glad/gl.h>    // before osmesa.h, which would pull in GL/gl.h

// osmesa.h relies on GLAPI and APIENTRY, which glad leaves undefined.
#ifndef APIENTRY
#define APIENTRY
#endif
#ifndef GLAPI
#define GLAPI extern
#endif

#include <GL/osmesa.h>

namespace ps {

// Software context rendering into a client-side RGBA buffer. Used by the
// GL tests, which skip when init() fails and print lastError().
class OsMesaContext : public GlContext {
public:
  OsMesaContext() = default;
  ~OsMesaContext() override;

  OsMesaContext(const OsMesaContext&) = delete;
  OsMesaContext& operator=(const OsMesaContext&) = delete;

  // Safe to call again; the previous context is destroyed first.
  bool init(int width, int height) override;

  // Software rendering has no back buffer; this waits for the frame.
  void swapBuffers() override;

private:
  void release();

  OSMesaContext mesa_{nullptr};
  std::vector<std::uint8_t> colorBuffer_;
};

} // namespace ps
