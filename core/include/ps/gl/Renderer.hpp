#pragma once
#include "ps/debug/Stats.hpp"
#include "ps/gl/CursorRenderer.hpp"
#include "ps/gl/GlyphRenderer.hpp"
#include "ps/gl/MeshRenderer.hpp"
#include "ps/gl/PostProcessRenderer.hpp"
#include "ps/gl/RenderTarget.hpp"
#include "ps/math/Transform.hpp"
#include <string>
#include <utility>
#include <vector>

namespace ps {

struct RendererConfig {
  int width{960};
  int height{540};
  int shadowMapSize{4096};
  bool postprocess{false};
  float clearColor[4] = {29.0f / 255.0f, 31.0f / 255.0f, 33.0f / 255.0f, 1.0f};
};

struct SceneObject {
  const GpuMesh* mesh{nullptr};
  Transform model = Transform::identity();
};

struct FrameInput {
  Transform view = Transform::identity();
  Transform light = Transform::identity();
  Vec3 lightDir{0.0f, -1.0f, 0.0f};
  float lightColor[3] = {1.0f, 1.0f, 1.0f};

  std::u32string text;
  float textX{0.05f};
  float textY{0.7f};
  bool cursorVisible{false};

  float time{0};  // seconds, drives the post-process effect
};

// Per frame: shadow depth, lit colour, optional post-process, then the text
// overlay and cursor on top.
class Renderer {
public:
  explicit Renderer(GlyphCache& glyphs);

  // Compile shaders, create render targets and set fixed GL state. Call once
  // after the GL context is current.
  bool init(const RendererConfig& cfg);

  MeshRenderer& meshRenderer() { return meshes_; }
  GlyphRenderer& glyphRenderer() { return glyphs_; }

  void setObjects(std::vector<SceneObject> objects) { objects_ = std::move(objects); }

  float aspect() const;

  Stats render(const FrameInput& frame);

private:
  RendererConfig cfg_;
  MeshRenderer meshes_;
  GlyphRenderer glyphs_;
  CursorRenderer cursor_;
  PostProcessRenderer post_;
  DepthTarget shadow_;
  ColorTarget offscreen_;
  std::vector<SceneObject> objects_;
  bool inited_{false};

  std::uint32_t drawObjects();
};

} // namespace ps
