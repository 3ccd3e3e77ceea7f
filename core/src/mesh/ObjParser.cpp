#include "ps/mesh/ObjParser.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unordered_map>
#include <vector>

namespace ps {

const char* objErrorKindName(ObjErrorKind kind) {
  switch (kind) {
    case ObjErrorKind::None:             return "None";
    case ObjErrorKind::FileRead:         return "FileRead";
    case ObjErrorKind::MissingType:      return "MissingType";
    case ObjErrorKind::MissingVertex:    return "MissingVertex";
    case ObjErrorKind::NonFloatVertex:   return "NonFloatVertex";
    case ObjErrorKind::MissingTexCoord:  return "MissingTexCoord";
    case ObjErrorKind::NonFloatTexCoord: return "NonFloatTexCoord";
    case ObjErrorKind::MissingFaceVert:  return "MissingFaceVert";
    case ObjErrorKind::TooManyFaceVerts: return "TooManyFaceVerts";
    case ObjErrorKind::InvalidFaceVert:  return "InvalidFaceVert";
    case ObjErrorKind::InvalidFaceUv:    return "InvalidFaceUv";
    case ObjErrorKind::InvalidFaceNorm:  return "InvalidFaceNorm";
    case ObjErrorKind::IndexOutOfRange:  return "IndexOutOfRange";
  }
  return "Unknown";
}

namespace {

struct FaceIndices {
  std::uint32_t vert{0};
  std::uint32_t uv{0};
  std::uint32_t norm{0};

  bool operator==(const FaceIndices& o) const {
    return vert == o.vert && uv == o.uv && norm == o.norm;
  }
};

struct FaceIndicesHash {
  std::size_t operator()(const FaceIndices& f) const {
    std::size_t h = f.vert;
    h = h * 1000003u ^ f.uv;
    h = h * 1000003u ^ f.norm;
    return h;
  }
};

struct ObjData {
  std::vector<std::array<float, 4>> positions;
  std::vector<std::array<float, 2>> uvs;
  std::vector<std::array<float, 3>> normals;
  std::vector<std::array<FaceIndices, 3>> faces;
};

ObjParseResult fail(ObjErrorKind kind, std::size_t line, const std::string& message) {
  ObjParseResult r;
  r.ok = false;
  r.err.kind = kind;
  r.err.line = line;
  r.err.message = message;
  return r;
}

bool parseFloat(const std::string& tok, float& out) {
  if (tok.empty()) return false;
  errno = 0;
  char* end = nullptr;
  out = std::strtof(tok.c_str(), &end);
  return end == tok.c_str() + tok.size() && errno != ERANGE;
}

// 1-based decimal index -> 0-based. Rejects signs other than '+', zero,
// fractions and overflow.
bool parseIndex(const std::string& tok, std::uint32_t& out) {
  std::size_t i = 0;
  if (!tok.empty() && tok[0] == '+') i = 1;
  if (i >= tok.size()) return false;

  std::uint64_t v = 0;
  for (; i < tok.size(); i++) {
    char c = tok[i];
    if (c < '0' || c > '9') return false;
    v = v * 10 + static_cast<std::uint64_t>(c - '0');
    if (v > 0xFFFFFFFFull) return false;
  }
  if (v == 0) return false;
  out = static_cast<std::uint32_t>(v - 1);
  return true;
}

std::vector<std::string> splitSlash(const std::string& tok) {
  std::vector<std::string> parts;
  std::size_t start = 0;
  while (true) {
    std::size_t pos = tok.find('/', start);
    if (pos == std::string::npos) {
      parts.push_back(tok.substr(start));
      break;
    }
    parts.push_back(tok.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

// Parses the tokens after the type token of one line into `data`.
// Returns a result with ok=false on the first malformed token.
ObjParseResult parseLine(const std::string& type, std::istringstream& toks,
                         std::size_t lineNo, ObjData& data) {
  std::string tok;

  if (type == "v") {
    std::array<float, 4> v{0.0f, 0.0f, 0.0f, 1.0f};
    for (int i = 0; i < 3; i++) {
      if (!(toks >> tok)) return fail(ObjErrorKind::MissingVertex, lineNo, "vertex needs x y z");
      if (!parseFloat(tok, v[static_cast<std::size_t>(i)]))
        return fail(ObjErrorKind::NonFloatVertex, lineNo, "non-numeric vertex component '" + tok + "'");
    }
    if (toks >> tok) {
      if (!parseFloat(tok, v[3]))
        return fail(ObjErrorKind::NonFloatVertex, lineNo, "non-numeric vertex w '" + tok + "'");
    }
    data.positions.push_back(v);
  } else if (type == "vt") {
    std::array<float, 2> uv{0.0f, 0.0f};
    for (int i = 0; i < 2; i++) {
      if (!(toks >> tok)) return fail(ObjErrorKind::MissingTexCoord, lineNo, "texture coordinate needs u v");
      if (!parseFloat(tok, uv[static_cast<std::size_t>(i)]))
        return fail(ObjErrorKind::NonFloatTexCoord, lineNo, "non-numeric texture coordinate '" + tok + "'");
    }
    data.uvs.push_back(uv);
  } else if (type == "vn") {
    std::array<float, 3> n{0.0f, 0.0f, 0.0f};
    for (int i = 0; i < 3; i++) {
      if (!(toks >> tok)) return fail(ObjErrorKind::MissingVertex, lineNo, "normal needs x y z");
      if (!parseFloat(tok, n[static_cast<std::size_t>(i)]))
        return fail(ObjErrorKind::NonFloatVertex, lineNo, "non-numeric normal component '" + tok + "'");
    }
    data.normals.push_back(n);
  } else if (type == "f") {
    std::array<FaceIndices, 3> face{};
    for (std::size_t i = 0; i < 3; i++) {
      if (!(toks >> tok))
        return fail(ObjErrorKind::MissingFaceVert, lineNo, "face needs three v/vt/vn vertices");

      auto parts = splitSlash(tok);
      if (!parseIndex(parts[0], face[i].vert))
        return fail(ObjErrorKind::InvalidFaceVert, lineNo, "bad face position index in '" + tok + "'");
      if (parts.size() < 2 || !parseIndex(parts[1], face[i].uv))
        return fail(ObjErrorKind::InvalidFaceUv, lineNo, "bad face uv index in '" + tok + "'");
      if (parts.size() < 3 || !parseIndex(parts[2], face[i].norm))
        return fail(ObjErrorKind::InvalidFaceNorm, lineNo, "bad face normal index in '" + tok + "'");
    }
    if (toks >> tok)
      return fail(ObjErrorKind::TooManyFaceVerts, lineNo, "only triangular faces are supported");
    data.faces.push_back(face);
  } else {
    std::fprintf(stderr, "ObjParser: unsupported line type '%s' (line %zu)\n",
                 type.c_str(), lineNo);
  }
  return ObjParseResult{};
}

// Merge identical (position, uv, normal) triples into one output vertex.
ObjParseResult buildMesh(const ObjData& data) {
  ObjParseResult r;
  std::unordered_map<FaceIndices, std::uint32_t, FaceIndicesHash> merged;
  r.mesh.faces.reserve(data.faces.size());

  for (const auto& face : data.faces) {
    Triangle tri{};
    for (std::size_t i = 0; i < 3; i++) {
      const FaceIndices& fi = face[i];
      auto it = merged.find(fi);
      if (it != merged.end()) {
        tri[i] = it->second;
        continue;
      }

      if (fi.vert >= data.positions.size() || fi.uv >= data.uvs.size() ||
          fi.norm >= data.normals.size()) {
        return fail(ObjErrorKind::IndexOutOfRange, 0,
                    "face refers to index " + std::to_string(fi.vert + 1) + "/" +
                    std::to_string(fi.uv + 1) + "/" + std::to_string(fi.norm + 1) +
                    " beyond the declared data");
      }

      MeshVertex v;
      const auto& p = data.positions[fi.vert];
      const auto& t = data.uvs[fi.uv];
      const auto& n = data.normals[fi.norm];
      for (int k = 0; k < 4; k++) v.position[k] = p[static_cast<std::size_t>(k)];
      for (int k = 0; k < 2; k++) v.uv[k] = t[static_cast<std::size_t>(k)];
      for (int k = 0; k < 3; k++) v.normal[k] = n[static_cast<std::size_t>(k)];

      auto idx = static_cast<std::uint32_t>(r.mesh.vertices.size());
      r.mesh.vertices.push_back(v);
      merged.emplace(fi, idx);
      tri[i] = idx;
    }
    r.mesh.faces.push_back(tri);
  }
  return r;
}

} // namespace

ObjParseResult parseObj(std::istream& in) {
  ObjData data;
  std::string line;
  std::size_t lineNo = 0;

  while (std::getline(in, line)) {
    lineNo++;
    std::istringstream toks(line);
    std::string type;
    if (!(toks >> type)) {
      return fail(ObjErrorKind::MissingType, lineNo, "line has no type token");
    }
    ObjParseResult r = parseLine(type, toks, lineNo, data);
    if (!r.ok) return r;
  }
  if (in.bad()) {
    return fail(ObjErrorKind::FileRead, lineNo, "stream read error");
  }

  return buildMesh(data);
}

ObjParseResult parseObjText(const std::string& text) {
  std::istringstream in(text);
  return parseObj(in);
}

ObjParseResult parseObjFile(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    return fail(ObjErrorKind::FileRead, 0, "cannot open " + path);
  }
  return parseObj(f);
}

} // namespace ps
