#pragma once
#include <array>
#include <cstdint>
#include <vector>

namespace ps {

// One merged vertex: a unique (position, uv, normal) combination.
struct MeshVertex {
  float position[4] = {0, 0, 0, 1};
  float uv[2] = {0, 0};
  float normal[3] = {0, 0, 0};
};

using Triangle = std::array<std::uint32_t, 3>;

// CPU-side mesh, consumed by MeshRenderer::uploadMesh.
struct Mesh {
  std::vector<MeshVertex> vertices;
  std::vector<Triangle> faces;

  std::uint32_t indexCount() const {
    return static_cast<std::uint32_t>(faces.size() * 3);
  }
};

} // namespace ps
