#ifdef PS_HAS_GLFW

#include "ps/gl/GlfwContext.hpp"
#include <glad/gl.h>
#include <GLFW/glfw3.h>
#include <utility>

namespace ps {

namespace {
const char* kOwner = "GlfwContext";
}

GlfwContext::GlfwContext(std::string title) : title_(std::move(title)) {}

GlfwContext::~GlfwContext() {
  if (window_) {
    glfwDestroyWindow(window_);
  }
  glfwTerminate();
}

bool GlfwContext::init(int width, int height) {
  lastError_.clear();
  if (!glfwInit()) {
    return fail(kOwner, "glfwInit failed");
  }

  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
  glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
  glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
  glfwWindowHint(GLFW_RESIZABLE, GLFW_FALSE);

  window_ = glfwCreateWindow(width, height, title_.c_str(), nullptr, nullptr);
  if (!window_) {
    const char* why = nullptr;
    glfwGetError(&why);
    return fail(kOwner, std::string("glfwCreateWindow failed: ") + (why ? why : "unknown error"));
  }

  glfwMakeContextCurrent(window_);

  if (!gladLoadGL(reinterpret_cast<GLADloadfunc>(glfwGetProcAddress))) {
    glfwDestroyWindow(window_);
    window_ = nullptr;
    return fail(kOwner, "gladLoadGL found no GL entry points");
  }

  glfwSwapInterval(1);
  glfwGetFramebufferSize(window_, &width_, &height_);

  glfwSetWindowUserPointer(window_, this);
  glfwSetKeyCallback(window_, keyCallback);

  return true;
}

void GlfwContext::swapBuffers() {
  if (window_) {
    glfwSwapBuffers(window_);
  }
}

bool GlfwContext::shouldClose() const {
  return window_ && glfwWindowShouldClose(window_);
}

void GlfwContext::pollEvents() {
  glfwPollEvents();
}

void GlfwContext::keyCallback(GLFWwindow* w, int key, int /*scancode*/, int action, int /*mods*/) {
  if (key == GLFW_KEY_ESCAPE && action == GLFW_PRESS) {
    glfwSetWindowShouldClose(w, GLFW_TRUE);
  }
}

} // namespace ps

#endif // PS_HAS_GLFW
