#include "ps/mesh/VertexPacking.hpp"
#include <cstring>

namespace ps {

static void putFloat(std::uint8_t* dst, float v) {
  std::memcpy(dst, &v, sizeof(float));
}

std::vector<std::uint8_t> packMeshVertices(const std::vector<MeshVertex>& vertices) {
  std::vector<std::uint8_t> out(vertices.size() * layout::kMeshStride);
  std::uint8_t* p = out.data();
  for (const auto& v : vertices) {
    for (int i = 0; i < 4; i++) putFloat(p + layout::kMeshPositionOffset + i * 4, v.position[i]);
    for (int i = 0; i < 2; i++) putFloat(p + layout::kMeshUvOffset + i * 4, v.uv[i]);
    for (int i = 0; i < 3; i++) putFloat(p + layout::kMeshNormalOffset + i * 4, v.normal[i]);
    p += layout::kMeshStride;
  }
  return out;
}

std::vector<std::uint8_t> packQuadVertices(const QuadVertex* vertices, std::size_t count) {
  std::vector<std::uint8_t> out(count * layout::kQuadStride);
  std::uint8_t* p = out.data();
  for (std::size_t i = 0; i < count; i++) {
    const QuadVertex& v = vertices[i];
    putFloat(p + layout::kQuadPositionOffset, v.x);
    putFloat(p + layout::kQuadPositionOffset + 4, v.y);
    putFloat(p + layout::kQuadUvOffset, v.u);
    putFloat(p + layout::kQuadUvOffset + 4, v.v);
    p += layout::kQuadStride;
  }
  return out;
}

std::vector<std::uint8_t> packTriangleIndices(const std::vector<Triangle>& faces) {
  std::vector<std::uint8_t> out(faces.size() * 3 * sizeof(std::uint32_t));
  std::uint8_t* p = out.data();
  for (const auto& tri : faces) {
    for (std::uint32_t idx : tri) {
      std::memcpy(p, &idx, sizeof(idx));
      p += sizeof(idx);
    }
  }
  return out;
}

float readPackedFloat(const std::vector<std::uint8_t>& bytes, std::size_t offset) {
  float v = 0.0f;
  if (offset + sizeof(float) <= bytes.size()) std::memcpy(&v, bytes.data() + offset, sizeof(float));
  return v;
}

} // namespace ps
