#pragma once
#include "ps/mesh/Mesh.hpp"

#include <cstddef>
#include <istream>
#include <string>

namespace ps {

// Subset of Wavefront OBJ: v, vt, vn and triangular f with v/vt/vn indices.
enum class ObjErrorKind {
  None,
  FileRead,
  MissingType,
  MissingVertex,
  NonFloatVertex,
  MissingTexCoord,
  NonFloatTexCoord,
  MissingFaceVert,
  TooManyFaceVerts,
  InvalidFaceVert,
  InvalidFaceUv,
  InvalidFaceNorm,
  IndexOutOfRange
};

const char* objErrorKindName(ObjErrorKind kind);

struct ObjParseError {
  ObjErrorKind kind{ObjErrorKind::None};
  std::size_t line{0};  // 1-based, 0 when not tied to a line
  std::string message;
};

struct ObjParseResult {
  bool ok{true};
  ObjParseError err{};
  Mesh mesh;
};

ObjParseResult parseObj(std::istream& in);
ObjParseResult parseObjText(const std::string& text);
ObjParseResult parseObjFile(const std::string& path);

} // namespace ps
