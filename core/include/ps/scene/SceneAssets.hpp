#pragma once
#include "ps/gl/MeshRenderer.hpp"
#include "ps/gl/Renderer.hpp"
#include "ps/gl/Texture.hpp"
#include <string>
#include <vector>

namespace ps {

// The desk scene on the GPU. Textures are declared first so they outlive the
// meshes borrowing them.
struct SceneAssets {
  Texture tableTex;
  Texture monitorTex;
  Texture screenTex;
  GpuMesh table;
  GpuMesh monitor;
  GpuMesh screen;

  // Table at the origin, monitor and screen raised and scaled up.
  std::vector<SceneObject> objects() const;
};

// Loads table/monitor/screen .obj and their _texture.png files from `dir`.
// On failure `error` names the asset and what went wrong.
bool loadSceneAssets(const std::string& dir, const MeshRenderer& meshes,
                     SceneAssets& out, std::string& error);

} // namespace ps
