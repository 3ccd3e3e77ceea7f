#pragma once
#include <string>
#include <vector>

namespace ps {

struct SceneConfig {
  int windowWidth{960};
  int windowHeight{540};
  std::string title{"Stream starting..."};
  float clearColor[4] = {29.0f / 255.0f, 31.0f / 255.0f, 33.0f / 255.0f, 1.0f};
  float lightDir[3] = {-0.3f, -1.0f, -0.6f};
  float lightColor[3] = {0.8f, 0.8f, 0.7f};
  int shadowMapSize{4096};

  double cursorBlinkSeconds{0.5};
  int glyphPixelSize{256};
  float textOrigin[2] = {0.05f, 0.7f};
  double waitSeconds{1.5};
  double deleteSeconds{1.5};
  double appendSeconds{1.5};

  double cameraSpin{1.0};  // radians per second
  bool postprocess{false};

  // Empty = the locations baked in at build time.
  std::string assetDir;
  std::string fontPath;
};

struct SceneConfigResult {
  bool ok{false};
  std::string error;
  std::vector<std::string> warnings;  // keys ignored for having the wrong type
  SceneConfig config;
};

// Missing keys keep their defaults. Malformed JSON or a non-object root fails.
SceneConfigResult parseSceneConfig(const std::string& json);
SceneConfigResult loadSceneConfigFile(const std::string& path);

} // namespace ps
