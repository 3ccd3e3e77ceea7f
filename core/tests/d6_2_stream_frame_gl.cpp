// D6.2: full frame of the desk scene with shadows, post-process and text.

#include "ps/app/StreamScreen.hpp"
#include "ps/gl/OsMesaContext.hpp"
#include "ps/gl/Renderer.hpp"
#include "ps/gl/Texture.hpp"
#include "ps/scene/SceneAssets.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

int main() {
#if !defined(FONT_PATH) || !defined(PS_ASSET_DIR)
  std::printf("FONT_PATH or PS_ASSET_DIR not defined, skipping test\n");
  return 0;
#else
  constexpr int W = 160;
  constexpr int H = 90;

  ps::OsMesaContext ctx;
  if (!ctx.init(W, H)) {
    std::fprintf(stderr, "Could not init OSMesa (%s), skipping test\n", ctx.lastError().c_str());
    return 0;
  }

  ps::GlGlyphUploader uploader;
  ps::GlyphCache glyphs(48);
  if (!glyphs.loadFontFile(FONT_PATH)) {
    std::fprintf(stderr, "Could not load %s, skipping test\n", FONT_PATH);
    return 0;
  }
  glyphs.setUploader(&uploader);

  ps::SceneConfig cfg;
  cfg.windowWidth = W;
  cfg.windowHeight = H;
  cfg.shadowMapSize = 256;
  cfg.postprocess = true;
  cfg.appendSeconds = 0.1;

  ps::RendererConfig rc;
  rc.width = W;
  rc.height = H;
  rc.shadowMapSize = cfg.shadowMapSize;
  rc.postprocess = cfg.postprocess;

  ps::Renderer renderer(glyphs);
  requireTrue(renderer.init(rc), "Renderer::init");

  ps::SceneAssets assets;
  std::string error;
  if (!ps::loadSceneAssets(PS_ASSET_DIR, renderer.meshRenderer(), assets, error)) {
    std::fprintf(stderr, "ASSERT FAIL: loadSceneAssets: %s\n", error.c_str());
    return 1;
  }
  renderer.setObjects(assets.objects());

  // Test 1: missing assets are reported by name
  {
    ps::SceneAssets none;
    std::string err;
    requireTrue(!ps::loadSceneAssets("/nonexistent", renderer.meshRenderer(), none, err),
                "missing directory fails");
    requireTrue(err.find("table") != std::string::npos, "error names the asset");
    std::printf("Test 1 (missing assets): PASS\n");
  }

  ps::StreamScreen screen(cfg, []() { return std::u32string(U"$ ./ps\n\nToday"); }, 0.0);
  screen.update(0.0);
  screen.update(0.5);
  screen.update(0.6);

  // Test 2: every pass runs
  {
    ps::FrameInput frame = screen.frame(renderer.aspect());
    requireTrue(frame.text == U"$ ./ps\n\nToday", "banner typed");
    requireTrue(frame.cursorVisible, "caret on");

    ps::Stats stats = renderer.render(frame);
    ctx.swapBuffers();
    requireTrue(stats.shadowDrawCalls == 3, "three meshes in the shadow pass");
    requireTrue(stats.meshDrawCalls == 3, "three meshes in the colour pass");
    requireTrue(stats.postprocessed, "post-process ran");
    requireTrue(stats.glyphQuads >= 8, "visible glyphs drawn");
    requireTrue(stats.cursorDrawn, "cursor drawn");
    requireTrue(stats.drawCalls == 3 + 3 + 1 + stats.glyphQuads + 1, "draw call total");
    requireTrue(glGetError() == GL_NO_ERROR, "no GL errors");
    std::printf("Test 2 (passes): PASS\n");
  }

  // Test 3: the image is not just the clear colour
  {
    auto px = ctx.readPixels();
    requireTrue(px.size() == static_cast<std::size_t>(W) * H * 4, "pixel count");
    int distinct = 0;
    for (std::size_t i = 0; i + 3 < px.size(); i += 4) {
      if (px[i] != px[0] || px[i + 1] != px[1] || px[i + 2] != px[2]) distinct++;
    }
    requireTrue(distinct > W * H / 20, "scene visible");
    std::printf("Test 3 (pixels): PASS\n");
  }

  // Test 4: frames keep rendering as the camera moves
  {
    screen.update(1.6);
    ps::Stats stats = renderer.render(screen.frame(renderer.aspect()));
    ctx.swapBuffers();
    requireTrue(stats.meshDrawCalls == 3, "still three meshes");
    requireTrue(stats.frameMs >= 0.0, "timed");
    std::printf("Test 4 (next frame): PASS\n");
  }

  std::printf("\nAll stream frame tests passed.\n");
  return 0;
#endif
}
