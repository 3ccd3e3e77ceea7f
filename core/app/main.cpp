// prestream: animated "stream starting soon" screen.
//
//   prestream --start-time 18:30:00 --topic "Writing a shadow mapper" [--config scene.json]

#include "ps/app/Args.hpp"
#include "ps/app/SceneConfig.hpp"
#include "ps/app/StreamMessage.hpp"
#include "ps/app/StreamScreen.hpp"
#include "ps/gl/GlfwContext.hpp"
#include "ps/gl/Renderer.hpp"
#include "ps/gl/Texture.hpp"
#include "ps/scene/SceneAssets.hpp"
#include "ps/text/GlyphCache.hpp"
#include "ps/text/Utf8.hpp"

#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <string>

#ifndef PS_ASSET_DIR
#define PS_ASSET_DIR "assets"
#endif

static int fatal(const std::string& msg) {
  std::fprintf(stderr, "prestream: %s\n", msg.c_str());
  return 1;
}

int main(int argc, char** argv) {
  std::string programName = argc > 0 ? argv[0] : "prestream";

  ps::ArgsResult parsed = ps::parseArgs(argc, argv);
  if (!parsed.ok) {
    if (!parsed.error.empty()) std::printf("%s\n", parsed.error.c_str());
    std::printf("%s\n", ps::usageText(programName).c_str());
    return 1;
  }
  const ps::Args& args = parsed.args;

  ps::SceneConfig cfg;
  if (!args.configPath.empty()) {
    ps::SceneConfigResult loaded = ps::loadSceneConfigFile(args.configPath);
    if (!loaded.ok) return fatal("config " + args.configPath + ": " + loaded.error);
    cfg = loaded.config;
  }
  if (cfg.assetDir.empty()) cfg.assetDir = PS_ASSET_DIR;
#ifdef FONT_PATH
  if (cfg.fontPath.empty()) cfg.fontPath = FONT_PATH;
#endif
  if (cfg.fontPath.empty()) return fatal("no font configured (set \"fontPath\" in --config)");

  // Declaration order is teardown order in reverse: GL objects go before the
  // context, glyph textures before their uploader.
  ps::GlfwContext ctx(cfg.title);
  if (!ctx.init(cfg.windowWidth, cfg.windowHeight)) return fatal("failed to create window: " + ctx.lastError());

  ps::GlGlyphUploader uploader;
  ps::GlyphCache glyphs(static_cast<std::uint32_t>(cfg.glyphPixelSize));
  if (!glyphs.loadFontFile(cfg.fontPath)) return fatal("failed to load font " + cfg.fontPath);
  glyphs.setUploader(&uploader);

  ps::RendererConfig rcfg;
  rcfg.width = ctx.width();
  rcfg.height = ctx.height();
  rcfg.shadowMapSize = cfg.shadowMapSize;
  rcfg.postprocess = cfg.postprocess;
  for (int i = 0; i < 4; i++) rcfg.clearColor[i] = cfg.clearColor[i];

  ps::Renderer renderer(glyphs);
  if (!renderer.init(rcfg)) return fatal("failed to create renderer");

  ps::SceneAssets assets;
  std::string assetError;
  if (!ps::loadSceneAssets(cfg.assetDir, renderer.meshRenderer(), assets, assetError)) {
    return fatal(assetError);
  }
  renderer.setObjects(assets.objects());

  // Everything the banner can show, so glyph failures surface here.
  if (!glyphs.ensureAscii() ||
      !glyphs.ensureGlyphs(ps::decodeUtf8(args.topic)) ||
      !glyphs.ensureGlyphs(ps::decodeUtf8(programName))) {
    return fatal("failed to get character");
  }

  auto clockStart = std::chrono::steady_clock::now();
  auto secondsNow = [clockStart]() {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - clockStart).count();
  };

  auto target = [&]() {
    return ps::decodeUtf8(ps::streamStartingString(programName, args.topic, args.startTime,
                                                   ps::localTimeOfDay()));
  };
  ps::StreamScreen screen(cfg, target, secondsNow());

  try {
    while (!ctx.shouldClose()) {
      screen.update(secondsNow());
      renderer.render(screen.frame(renderer.aspect()));
      ctx.swapBuffers();
      ctx.pollEvents();
    }
  } catch (const std::logic_error& e) {
    return fatal(e.what());
  }

  return 0;
}
