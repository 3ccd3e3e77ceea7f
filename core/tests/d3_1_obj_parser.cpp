// D3.1: OBJ parsing, vertex merging and error kinds.

#include "ps/mesh/ObjParser.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <set>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireNear(float a, float b, float eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.6f, expected %.6f)\n", msg, a, b);
    std::exit(1);
  }
}

static void requireError(const std::string& text, ps::ObjErrorKind kind, std::size_t line,
                         const char* msg) {
  ps::ObjParseResult r = ps::parseObjText(text);
  if (r.ok || r.err.kind != kind || (line && r.err.line != line)) {
    std::fprintf(stderr, "ASSERT FAIL: %s (ok=%d kind=%s line=%zu)\n", msg, r.ok ? 1 : 0,
                 ps::objErrorKindName(r.err.kind), r.err.line);
    std::exit(1);
  }
}

// Unit cube: 8 positions, 4 uvs, 6 normals, two triangles per side.
static std::string cubeObj() {
  std::string s =
    "v -1 -1 -1\nv 1 -1 -1\nv 1 1 -1\nv -1 1 -1\n"
    "v -1 -1 1\nv 1 -1 1\nv 1 1 1\nv -1 1 1\n"
    "vt 0 0\nvt 1 0\nvt 1 1\nvt 0 1\n"
    "vn 0 0 -1\nvn 0 0 1\nvn -1 0 0\nvn 1 0 0\nvn 0 -1 0\nvn 0 1 0\n";
  const int sides[6][4] = {
    {1, 4, 3, 2}, {5, 6, 7, 8}, {1, 5, 8, 4}, {2, 3, 7, 6}, {1, 2, 6, 5}, {4, 8, 7, 3}};
  for (int f = 0; f < 6; f++) {
    int n = f + 1;
    const int* v = sides[f];
    char buf[128];
    std::snprintf(buf, sizeof(buf), "f %d/1/%d %d/2/%d %d/3/%d\n", v[0], n, v[1], n, v[2], n);
    s += buf;
    std::snprintf(buf, sizeof(buf), "f %d/1/%d %d/3/%d %d/4/%d\n", v[0], n, v[2], n, v[3], n);
    s += buf;
  }
  return s;
}

// Same cube with one uv and one normal per corner, so corners are shared
// across sides.
static std::string smoothCubeObj() {
  std::string s =
    "v -1 -1 -1\nv 1 -1 -1\nv 1 1 -1\nv -1 1 -1\n"
    "v -1 -1 1\nv 1 -1 1\nv 1 1 1\nv -1 1 1\n";
  for (int i = 0; i < 8; i++) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "vt %d %d\n", i & 1, (i >> 1) & 1);
    s += buf;
  }
  s += "vn -0.577 -0.577 -0.577\nvn 0.577 -0.577 -0.577\nvn 0.577 0.577 -0.577\n"
       "vn -0.577 0.577 -0.577\nvn -0.577 -0.577 0.577\nvn 0.577 -0.577 0.577\n"
       "vn 0.577 0.577 0.577\nvn -0.577 0.577 0.577\n";
  const int sides[6][4] = {
    {1, 4, 3, 2}, {5, 6, 7, 8}, {1, 5, 8, 4}, {2, 3, 7, 6}, {1, 2, 6, 5}, {4, 8, 7, 3}};
  for (const auto& v : sides) {
    char buf[128];
    std::snprintf(buf, sizeof(buf), "f %d/%d/%d %d/%d/%d %d/%d/%d\n",
                  v[0], v[0], v[0], v[1], v[1], v[1], v[2], v[2], v[2]);
    s += buf;
    std::snprintf(buf, sizeof(buf), "f %d/%d/%d %d/%d/%d %d/%d/%d\n",
                  v[0], v[0], v[0], v[2], v[2], v[2], v[3], v[3], v[3]);
    s += buf;
  }
  return s;
}

int main() {
  // Test 1: cube corners are split per side, shared within a side
  {
    ps::ObjParseResult r = ps::parseObjText(cubeObj());
    requireTrue(r.ok, "cube parses");
    requireTrue(r.mesh.vertices.size() == 24, "24 unique corners");
    requireTrue(r.mesh.faces.size() == 12, "12 triangles");
    requireTrue(r.mesh.indexCount() == 36, "36 indices");
    for (const auto& tri : r.mesh.faces)
      for (auto idx : tri) requireTrue(idx < 24, "index in range");
    std::printf("Test 1 (cube dedup): PASS\n");
  }

  // Test 1b: fully shared corners merge down to the 8 positions
  {
    ps::ObjParseResult r = ps::parseObjText(smoothCubeObj());
    requireTrue(r.ok, "smooth cube parses");
    requireTrue(r.mesh.vertices.size() == 8, "8 unique corners");
    requireTrue(r.mesh.indexCount() == 36, "36 indices");
    std::set<std::uint32_t> used;
    for (const auto& tri : r.mesh.faces)
      for (auto idx : tri) used.insert(idx);
    requireTrue(used.size() == 8 && *used.rbegin() == 7, "every corner referenced");
    requireNear(r.mesh.vertices[0].position[0], -1.0f, 0.0f, "first-seen corner first");
    std::printf("Test 1b (shared corners): PASS\n");
  }

  // Test 2: quad shares two corners, first-seen order, values copied
  {
    ps::ObjParseResult r = ps::parseObjText(
      "v 0 0 0\nv 1 0 0\nv 1 1 0 0.5\nv 0 1 0\n"
      "vt 0 0\nvt 1 0\nvt 1 1\nvt 0 1\n"
      "vn 0 0 1\n"
      "f 1/1/1 2/2/1 3/3/1\n"
      "f 1/1/1 3/3/1 4/4/1\n");
    requireTrue(r.ok, "quad parses");
    requireTrue(r.mesh.vertices.size() == 4, "4 merged vertices");
    requireTrue(r.mesh.faces[1][0] == 0 && r.mesh.faces[1][1] == 2 && r.mesh.faces[1][2] == 3,
                "second triangle reuses 0 and 2");
    const ps::MeshVertex& v2 = r.mesh.vertices[2];
    requireNear(v2.position[0], 1.0f, 0.0f, "position x");
    requireNear(v2.position[3], 0.5f, 0.0f, "explicit w");
    requireNear(r.mesh.vertices[0].position[3], 1.0f, 0.0f, "default w");
    requireNear(v2.uv[0], 1.0f, 0.0f, "uv u");
    requireNear(v2.normal[2], 1.0f, 0.0f, "normal z");
    std::printf("Test 2 (quad): PASS\n");
  }

  // Test 3: same position with different normals stays separate
  {
    ps::ObjParseResult r = ps::parseObjText(
      "v 0 0 0\nv 1 0 0\nv 0 1 0\nvt 0 0\nvn 0 0 1\nvn 0 0 -1\n"
      "f 1/1/1 2/1/1 3/1/1\nf 1/1/2 3/1/2 2/1/2\n");
    requireTrue(r.ok, "parses");
    requireTrue(r.mesh.vertices.size() == 6, "hard edge keeps 6 vertices");
    std::printf("Test 3 (hard edges): PASS\n");
  }

  // Test 4: unknown line types are skipped
  {
    ps::ObjParseResult r = ps::parseObjText(
      "o tri\nv 0 0 0\nv 1 0 0\nv 0 1 0\nvt 0 0\nvn 0 0 1\ns off\nf 1/1/1 2/1/1 3/1/1\n");
    requireTrue(r.ok, "unknown lines are not fatal");
    requireTrue(r.mesh.faces.size() == 1, "one face");
    std::printf("Test 4 (unknown types): PASS\n");
  }

  // Test 5: each malformed input has its own error kind and line
  {
    using K = ps::ObjErrorKind;
    requireError("v 0 0 0\n\nv 1 1 1\n", K::MissingType, 2, "empty line");
    requireError("v 0 0 0\n   \n", K::MissingType, 2, "blank line");
    requireError("v 1 2\n", K::MissingVertex, 1, "short vertex");
    requireError("v 1 x 2\n", K::NonFloatVertex, 1, "non-numeric vertex");
    requireError("v 1 2 3 w\n", K::NonFloatVertex, 1, "non-numeric w");
    requireError("vn 0 0\n", K::MissingVertex, 1, "short normal");
    requireError("vt 0.5\n", K::MissingTexCoord, 1, "short uv");
    requireError("vt a b\n", K::NonFloatTexCoord, 1, "non-numeric uv");
    requireError("f 1/1/1 2/2/2\n", K::MissingFaceVert, 1, "two-vertex face");
    requireError("f a/1/1 2/2/2 3/3/3\n", K::InvalidFaceVert, 1, "bad position index");
    requireError("f 1.1/1/1 2/2/2 3/3/3\n", K::InvalidFaceVert, 1, "fractional index");
    requireError("f 0/1/1 2/2/2 3/3/3\n", K::InvalidFaceVert, 1, "zero index");
    requireError("f -1/1/1 2/2/2 3/3/3\n", K::InvalidFaceVert, 1, "relative index");
    requireError("f 1/x/1 2/2/2 3/3/3\n", K::InvalidFaceUv, 1, "bad uv index");
    requireError("f 1//1 2//2 3//3\n", K::InvalidFaceUv, 1, "missing uv index");
    requireError("f 1/1 2/2 3/3\n", K::InvalidFaceNorm, 1, "missing normal index");
    requireError("f 1/1/1 2/2/2 3/3/3 4/4/4\n", K::TooManyFaceVerts, 1, "quad face");
    requireError("v 0 0 0\nvt 0 0\nvn 0 0 1\nf 1/1/1 2/1/1 1/1/1\n", K::IndexOutOfRange, 0,
                 "index past the data");
    std::printf("Test 5 (errors): PASS\n");
  }

  // Test 6: file errors
  {
    ps::ObjParseResult r = ps::parseObjFile("/nonexistent/dir/missing.obj");
    requireTrue(!r.ok && r.err.kind == ps::ObjErrorKind::FileRead, "missing file");
    std::printf("Test 6 (file read): PASS\n");
  }

#ifdef PS_ASSET_DIR
  // Test 7: shipped meshes load
  {
    const char* names[] = {"table", "monitor", "screen"};
    for (const char* n : names) {
      ps::ObjParseResult r = ps::parseObjFile(std::string(PS_ASSET_DIR) + "/" + n + ".obj");
      requireTrue(r.ok, "asset parses");
      requireTrue(!r.mesh.faces.empty(), "asset has faces");
      requireTrue(r.mesh.vertices.size() <= r.mesh.indexCount(), "merging never adds vertices");
    }
    std::printf("Test 7 (assets): PASS\n");
  }
#endif

  std::printf("\nAll OBJ parser tests passed.\n");
  return 0;
}
