#pragma once
#include "ps/mesh/Mesh.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ps {

// Byte layouts of the GL vertex buffers. Floats are IEEE-754 binary32 in host
// byte order, tightly packed, no padding.
//
//   MeshVertex (stride 36): position xyzw @0, uv @16, normal xyz @24
//   QuadVertex (stride 16): position xy @0, uv @8
namespace layout {
inline constexpr std::size_t kMeshStride = 36;
inline constexpr std::size_t kMeshPositionOffset = 0;
inline constexpr std::size_t kMeshUvOffset = 16;
inline constexpr std::size_t kMeshNormalOffset = 24;

inline constexpr std::size_t kQuadStride = 16;
inline constexpr std::size_t kQuadPositionOffset = 0;
inline constexpr std::size_t kQuadUvOffset = 8;
} // namespace layout

struct QuadVertex {
  float x{0}, y{0};
  float u{0}, v{0};
};

std::vector<std::uint8_t> packMeshVertices(const std::vector<MeshVertex>& vertices);
std::vector<std::uint8_t> packQuadVertices(const QuadVertex* vertices, std::size_t count);

// Flattened 32-bit index list, three per triangle.
std::vector<std::uint8_t> packTriangleIndices(const std::vector<Triangle>& faces);

// Reads back one float written by the packers (tests, debugging).
float readPackedFloat(const std::vector<std::uint8_t>& bytes, std::size_t offset);

} // namespace ps
