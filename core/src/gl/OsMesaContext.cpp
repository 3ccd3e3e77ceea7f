#include "ps/gl/OsMesaContext.hpp"
#include <string>

namespace ps {

namespace {

constexpr int kDepthBits = 24; // scene depth test and the shadow pass

const char* kOwner = "OsMesaContext";

} // namespace

OsMesaContext::~OsMesaContext() {
  release();
}

void OsMesaContext::release() {
  if (mesa_) {
    OSMesaDestroyContext(mesa_);
    mesa_ = nullptr;
  }
  colorBuffer_.clear();
  width_ = 0;
  height_ = 0;
}

bool OsMesaContext::init(int width, int height) {
  release();
  lastError_.clear();

  if (width <= 0 || height <= 0) {
    return fail(kOwner, "invalid size " + std::to_string(width) + "x" + std::to_string(height));
  }

  const int attribs[] = {
    OSMESA_FORMAT, OSMESA_RGBA,
    OSMESA_DEPTH_BITS, kDepthBits,
    OSMESA_STENCIL_BITS, 0,
    OSMESA_ACCUM_BITS, 0,
    OSMESA_PROFILE, OSMESA_CORE_PROFILE,
    OSMESA_CONTEXT_MAJOR_VERSION, 3,
    OSMESA_CONTEXT_MINOR_VERSION, 3,
    0
  };
  mesa_ = OSMesaCreateContextAttribs(attribs, nullptr);
  if (!mesa_) {
    return fail(kOwner, "OSMesaCreateContextAttribs refused a 3.3 core profile");
  }

  colorBuffer_.assign(static_cast<std::size_t>(width) * height * 4, 0);
  if (!OSMesaMakeCurrent(mesa_, colorBuffer_.data(), GL_UNSIGNED_BYTE, width, height)) {
    release();
    return fail(kOwner, "OSMesaMakeCurrent failed for " + std::to_string(width) + "x" +
                            std::to_string(height));
  }
  // Keep rows bottom first so the buffer matches glReadPixels order.
  OSMesaPixelStore(OSMESA_Y_UP, 1);

  int version = gladLoadGL(reinterpret_cast<GLADloadfunc>(OSMesaGetProcAddress));
  if (!version) {
    release();
    return fail(kOwner, "gladLoadGL found no GL entry points");
  }
  if (GLAD_VERSION_MAJOR(version) < 3 ||
      (GLAD_VERSION_MAJOR(version) == 3 && GLAD_VERSION_MINOR(version) < 3)) {
    int major = GLAD_VERSION_MAJOR(version);
    int minor = GLAD_VERSION_MINOR(version);
    release();
    return fail(kOwner, "context reports GL " + std::to_string(major) + "." +
                            std::to_string(minor) + ", need 3.3");
  }

  width_ = width;
  height_ = height;
  return true;
}

void OsMesaContext::swapBuffers() {
  glFinish();
}

} // namespace ps
