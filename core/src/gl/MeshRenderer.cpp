#include "ps/gl/MeshRenderer.hpp"
#include "ps/mesh/VertexPacking.hpp"
#include <climits>
#include <cstdio>
#include <utility>

namespace ps {

static const char* kMeshVert = R"GLSL(
#version 330 core
in vec4 a_position;
in vec2 a_uv;
in vec3 a_normal;
uniform mat4 u_model;
uniform mat4 u_view;
uniform mat4 u_viewToLight;
out vec2 v_uv;
out vec3 v_normal;
out vec4 v_lightPos;
void main() {
    vec4 clip = u_view * (u_model * a_position);
    gl_Position = clip;
    v_uv = vec2(a_uv.x, 1.0 - a_uv.y);
    v_normal = mat3(u_model) * a_normal;
    v_lightPos = u_viewToLight * clip;
}
)GLSL";

static const char* kMeshFrag = R"GLSL(
#version 330 core
uniform sampler2D u_tex;
uniform sampler2D u_lightTex;
uniform vec3 u_lightDir;
uniform vec3 u_lightColor;
uniform int u_shadows;
in vec2 v_uv;
in vec3 v_normal;
in vec4 v_lightPos;
out vec4 outColor;

float lightVisibility() {
    if (u_shadows == 0) return 1.0;
    vec3 p = v_lightPos.xyz / v_lightPos.w * 0.5 + 0.5;
    if (p.x < 0.0 || p.x > 1.0 || p.y < 0.0 || p.y > 1.0 || p.z > 1.0) return 1.0;
    float closest = texture(u_lightTex, p.xy).r;
    return (p.z - 0.002 <= closest) ? 1.0 : 0.0;
}

void main() {
    vec4 base = texture(u_tex, v_uv);
    vec3 n = normalize(v_normal);
    float diffuse = max(dot(n, -u_lightDir), 0.0) * lightVisibility();
    vec3 ambient = 0.25 * base.rgb;
    outColor = vec4(ambient + base.rgb * u_lightColor * diffuse, base.a);
}
)GLSL";

GpuMesh::~GpuMesh() {
  reset();
}

GpuMesh::GpuMesh(GpuMesh&& o) noexcept
  : vao_(o.vao_), vbo_(o.vbo_), ebo_(o.ebo_), texture_(o.texture_), indexCount_(o.indexCount_) {
  o.vao_ = o.vbo_ = o.ebo_ = 0;
  o.indexCount_ = 0;
}

GpuMesh& GpuMesh::operator=(GpuMesh&& o) noexcept {
  if (this != &o) {
    reset();
    vao_ = o.vao_;
    vbo_ = o.vbo_;
    ebo_ = o.ebo_;
    texture_ = o.texture_;
    indexCount_ = o.indexCount_;
    o.vao_ = o.vbo_ = o.ebo_ = 0;
    o.indexCount_ = 0;
  }
  return *this;
}

void GpuMesh::reset() {
  if (ebo_) glDeleteBuffers(1, &ebo_);
  if (vbo_) glDeleteBuffers(1, &vbo_);
  if (vao_) glDeleteVertexArrays(1, &vao_);
  vao_ = vbo_ = ebo_ = 0;
}

bool MeshRenderer::init() {
  if (!prog_.build(kMeshVert, kMeshFrag)) {
    std::fprintf(stderr, "MeshRenderer::init: failed to build mesh shader\n");
    return false;
  }
  uModel_ = prog_.uniformLocation("u_model");
  uView_ = prog_.uniformLocation("u_view");
  uViewToLight_ = prog_.uniformLocation("u_viewToLight");
  uLightDir_ = prog_.uniformLocation("u_lightDir");
  uLightColor_ = prog_.uniformLocation("u_lightColor");
  uTex_ = prog_.uniformLocation("u_tex");
  uLightTex_ = prog_.uniformLocation("u_lightTex");
  uShadows_ = prog_.uniformLocation("u_shadows");

  prog_.use();
  prog_.setUniformInt(uTex_, 0);
  prog_.setUniformInt(uLightTex_, 1);
  prog_.setUniformInt(uShadows_, 0);
  prog_.setUniformMat4(uModel_, Transform::identity());
  prog_.setUniformMat4(uView_, Transform::identity());
  prog_.setUniformMat4(uViewToLight_, Transform::identity());
  prog_.setUniformVec3(uLightDir_, 0.0f, -1.0f, 0.0f);
  prog_.setUniformVec3(uLightColor_, 1.0f, 1.0f, 1.0f);
  glUseProgram(0);
  return true;
}

// Binds one float attribute if the program declares it.
static void bindAttrib(const ShaderProgram& prog, const char* name, GLint size,
                       std::size_t offset) {
  GLint loc = prog.attribLocation(name);
  if (loc < 0) return;
  glEnableVertexAttribArray(static_cast<GLuint>(loc));
  glVertexAttribPointer(static_cast<GLuint>(loc), size, GL_FLOAT, GL_FALSE,
                        static_cast<GLsizei>(layout::kMeshStride),
                        reinterpret_cast<const void*>(offset));
}

bool MeshRenderer::uploadMesh(const Mesh& mesh, GLuint texture, GpuMesh& out) const {
  if (mesh.faces.size() > static_cast<std::size_t>(INT_MAX / 3)) {
    std::fprintf(stderr, "MeshRenderer: mesh has too many triangles (%zu)\n", mesh.faces.size());
    return false;
  }

  auto vertexBytes = packMeshVertices(mesh.vertices);
  auto indexBytes = packTriangleIndices(mesh.faces);

  GpuMesh gm;
  glGenVertexArrays(1, &gm.vao_);
  glBindVertexArray(gm.vao_);

  glGenBuffers(1, &gm.vbo_);
  glBindBuffer(GL_ARRAY_BUFFER, gm.vbo_);
  glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(vertexBytes.size()),
               vertexBytes.data(), GL_STATIC_DRAW);

  glGenBuffers(1, &gm.ebo_);
  glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, gm.ebo_);
  glBufferData(GL_ELEMENT_ARRAY_BUFFER, static_cast<GLsizeiptr>(indexBytes.size()),
               indexBytes.data(), GL_STATIC_DRAW);

  bindAttrib(prog_, "a_position", 4, layout::kMeshPositionOffset);
  bindAttrib(prog_, "a_uv", 2, layout::kMeshUvOffset);
  bindAttrib(prog_, "a_normal", 3, layout::kMeshNormalOffset);

  glBindVertexArray(0);
  glBindBuffer(GL_ARRAY_BUFFER, 0);

  GLenum err = glGetError();
  if (err != GL_NO_ERROR) {
    std::fprintf(stderr, "MeshRenderer: mesh upload failed (0x%x)\n", err);
    return false;
  }

  gm.texture_ = texture;
  gm.indexCount_ = static_cast<GLsizei>(mesh.indexCount());
  out = std::move(gm);
  return true;
}

void MeshRenderer::setCameraTransform(const Transform& t) {
  prog_.use();
  prog_.setUniformMat4(uView_, t);
}

void MeshRenderer::setViewToLight(const Transform& t) {
  prog_.use();
  prog_.setUniformMat4(uViewToLight_, t);
}

void MeshRenderer::setLightDir(const Vec3& dir) {
  Vec3 n = dir.normalized();
  prog_.use();
  prog_.setUniformVec3(uLightDir_, n.x, n.y, n.z);
}

void MeshRenderer::setLightColor(float r, float g, float b) {
  prog_.use();
  prog_.setUniformVec3(uLightColor_, r, g, b);
}

void MeshRenderer::setLightTexture(GLuint tex) {
  lightTex_ = tex;
  prog_.use();
  prog_.setUniformInt(uShadows_, tex ? 1 : 0);
}

void MeshRenderer::render(const GpuMesh& mesh, const Transform& model) {
  prog_.use();
  prog_.setUniformMat4(uModel_, model);

  glActiveTexture(GL_TEXTURE1);
  glBindTexture(GL_TEXTURE_2D, lightTex_);
  glActiveTexture(GL_TEXTURE0);
  glBindTexture(GL_TEXTURE_2D, mesh.texture());

  glBindVertexArray(mesh.vao());
  glDrawElements(GL_TRIANGLES, mesh.indexCount(), GL_UNSIGNED_INT, nullptr);
  glBindVertexArray(0);

  glBindTexture(GL_TEXTURE_2D, 0);
  glActiveTexture(GL_TEXTURE1);
  glBindTexture(GL_TEXTURE_2D, 0);
  glActiveTexture(GL_TEXTURE0);
}

} // namespace ps
