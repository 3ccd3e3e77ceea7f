#include "ps/gl/Renderer.hpp"
#include "ps/scene/Camera.hpp"
#include <chrono>
#include <cstdio>

namespace ps {

Renderer::Renderer(GlyphCache& glyphs) : glyphs_(glyphs) {}

bool Renderer::init(const RendererConfig& cfg) {
  cfg_ = cfg;

  if (!meshes_.init()) return false;
  if (!glyphs_.init()) return false;
  if (!cursor_.init()) return false;

  if (!shadow_.init(cfg.shadowMapSize)) {
    std::fprintf(stderr, "Renderer::init: shadow map %dx%d unavailable\n",
                 cfg.shadowMapSize, cfg.shadowMapSize);
    return false;
  }
  if (cfg.postprocess) {
    if (!post_.init()) return false;
    if (!offscreen_.init(cfg.width, cfg.height)) {
      std::fprintf(stderr, "Renderer::init: offscreen target unavailable\n");
      return false;
    }
  }

  glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
  glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
  glDepthFunc(GL_LESS);

  inited_ = true;
  return true;
}

float Renderer::aspect() const {
  return static_cast<float>(cfg_.width) / static_cast<float>(cfg_.height);
}

std::uint32_t Renderer::drawObjects() {
  std::uint32_t calls = 0;
  for (const auto& obj : objects_) {
    if (!obj.mesh || !obj.mesh->valid()) continue;
    meshes_.render(*obj.mesh, obj.model);
    calls++;
  }
  return calls;
}

Stats Renderer::render(const FrameInput& frame) {
  Stats stats;
  if (!inited_) return stats;
  auto t0 = std::chrono::steady_clock::now();

  // ---- Shadow depth ----
  glEnable(GL_DEPTH_TEST);
  glDisable(GL_BLEND);
  shadow_.bind();
  glClear(GL_DEPTH_BUFFER_BIT);
  meshes_.setLightTexture(0);
  meshes_.setCameraTransform(frame.light);
  stats.shadowDrawCalls = drawObjects();

  // ---- Lit colour ----
  if (cfg_.postprocess) {
    offscreen_.bind();
  } else {
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
    glViewport(0, 0, cfg_.width, cfg_.height);
  }
  glClearColor(cfg_.clearColor[0], cfg_.clearColor[1], cfg_.clearColor[2], cfg_.clearColor[3]);
  glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

  meshes_.setCameraTransform(frame.view);
  meshes_.setViewToLight(viewToLight(frame.light, frame.view));
  meshes_.setLightDir(frame.lightDir);
  meshes_.setLightColor(frame.lightColor[0], frame.lightColor[1], frame.lightColor[2]);
  meshes_.setLightTexture(shadow_.texture());
  stats.meshDrawCalls = drawObjects();

  float aspect = this->aspect();
  glDisable(GL_DEPTH_TEST);

  // ---- Post-process ----
  if (cfg_.postprocess) {
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
    glViewport(0, 0, cfg_.width, cfg_.height);
    post_.render(offscreen_.texture(), frame.time, aspect);
    stats.postprocessed = true;
    stats.drawCalls++;
  }

  // ---- Text and cursor ----
  glEnable(GL_BLEND);
  GlyphDrawResult text = glyphs_.render(frame.text, frame.textX, frame.textY, aspect);
  stats.glyphQuads = text.quads;

  if (frame.cursorVisible) {
    float h = glyphs_.lineHeight() * 0.6f;
    float w = h / 2.0f;
    cursor_.render(frame.textX + text.advanceX, frame.textY + text.advanceY, w, h, aspect);
    stats.cursorDrawn = true;
    stats.drawCalls++;
  }
  glDisable(GL_BLEND);

  stats.drawCalls += stats.shadowDrawCalls + stats.meshDrawCalls + stats.glyphQuads;
  glFlush();

  auto t1 = std::chrono::steady_clock::now();
  stats.frameMs = std::chrono::duration<double, std::milli>(t1 - t0).count();
  return stats;
}

} // namespace ps
