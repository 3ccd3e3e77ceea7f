#include "ps/scene/SceneAssets.hpp"
#include "ps/image/ImageLoader.hpp"
#include "ps/mesh/ObjParser.hpp"
#include "ps/scene/Camera.hpp"

namespace ps {

std::vector<SceneObject> SceneAssets::objects() const {
  Transform monitorXf = monitorModel();
  return {
    SceneObject{&table, tableModel()},
    SceneObject{&monitor, monitorXf},
    SceneObject{&screen, monitorXf},
  };
}

static bool loadOne(const std::string& dir, const char* name, const MeshRenderer& meshes,
                    Texture& tex, GpuMesh& mesh, std::string& error) {
  std::string base = dir.empty() ? std::string(name) : dir + "/" + name;

  ObjParseResult obj = parseObjFile(base + ".obj");
  if (!obj.ok) {
    error = std::string("failed to load ") + name + " obj: " +
            objErrorKindName(obj.err.kind) + " at line " + std::to_string(obj.err.line) +
            ": " + obj.err.message;
    return false;
  }

  ImageResult img = loadPngFile(base + "_texture.png");
  if (!img.ok) {
    error = std::string("failed to load ") + name + " texture: " + img.error;
    return false;
  }
  if (!tex.uploadImage(img.image)) {
    error = std::string("failed to upload ") + name + " texture";
    return false;
  }

  if (!meshes.uploadMesh(obj.mesh, tex.id(), mesh)) {
    error = std::string("failed to upload ") + name + " to gpu";
    return false;
  }
  return true;
}

bool loadSceneAssets(const std::string& dir, const MeshRenderer& meshes,
                     SceneAssets& out, std::string& error) {
  return loadOne(dir, "table", meshes, out.tableTex, out.table, error) &&
         loadOne(dir, "monitor", meshes, out.monitorTex, out.monitor, error) &&
         loadOne(dir, "screen", meshes, out.screenTex, out.screen, error);
}

} // namespace ps
