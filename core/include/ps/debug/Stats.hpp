#pragma once
#include <cstdint>

namespace ps {

// Per-frame counters returned by Renderer::render.
struct Stats {
  // Timing
  double frameMs = 0.0;

  // Rendering
  std::uint32_t drawCalls = 0;        // all passes
  std::uint32_t shadowDrawCalls = 0;
  std::uint32_t meshDrawCalls = 0;    // lit colour pass
  std::uint32_t glyphQuads = 0;
  bool cursorDrawn = false;
  bool postprocessed = false;
};

} // namespace ps
