#pragma once
#include "ps/gl/GlContext.hpp"

#ifdef PS_HAS_GLFW

#include <string>

struct GLFWwindow;

namespace ps {

// Fixed-size window with a 3.3 core context.
class GlfwContext : public GlContext {
public:
  explicit GlfwContext(std::string title);
  ~GlfwContext() override;

  GlfwContext(const GlfwContext&) = delete;
  GlfwContext& operator=(const GlfwContext&) = delete;

  bool init(int width, int height) override;
  void swapBuffers() override;

  // Processes pending window events. Escape requests close.
  void pollEvents();
  bool shouldClose() const;

private:
  std::string title_;
  GLFWwindow* window_{nullptr};

  static void keyCallback(GLFWwindow* w, int key, int scancode, int action, int mods);
};

} // namespace ps

#endif // PS_HAS_GLFW
