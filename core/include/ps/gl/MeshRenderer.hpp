#pragma once
#include "ps/gl/ShaderProgram.hpp"
#include "ps/math/Transform.hpp"
#include "ps/mesh/Mesh.hpp"
#include <glad/gl.h>
#include <cstdint>

namespace ps {

// GPU copy of a Mesh. Owns its vertex array and buffers; the texture is
// borrowed and must outlive the GpuMesh.
class GpuMesh {
public:
  GpuMesh() = default;
  ~GpuMesh();

  GpuMesh(const GpuMesh&) = delete;
  GpuMesh& operator=(const GpuMesh&) = delete;
  GpuMesh(GpuMesh&& o) noexcept;
  GpuMesh& operator=(GpuMesh&& o) noexcept;

  GLuint vao() const { return vao_; }
  GLuint texture() const { return texture_; }
  GLsizei indexCount() const { return indexCount_; }
  bool valid() const { return vao_ != 0; }

private:
  friend class MeshRenderer;

  GLuint vao_{0};
  GLuint vbo_{0};
  GLuint ebo_{0};
  GLuint texture_{0};
  GLsizei indexCount_{0};

  void reset();
};

// Textured, directionally lit meshes with shadow-map lookups.
//
// Texture units: 0 = mesh texture (u_tex), 1 = shadow depth (u_lightTex).
// Every setter binds the program itself, so they may be called in any order.
class MeshRenderer {
public:
  MeshRenderer() = default;

  // Compile shaders. Call once after the GL context is current.
  bool init();

  bool uploadMesh(const Mesh& mesh, GLuint texture, GpuMesh& out) const;

  void setCameraTransform(const Transform& t);
  void setViewToLight(const Transform& t);
  void setLightDir(const Vec3& dir);  // normalized here
  void setLightColor(float r, float g, float b);
  void setLightTexture(GLuint tex);   // 0 disables shadow lookups

  void render(const GpuMesh& mesh, const Transform& model);

  const ShaderProgram& program() const { return prog_; }

private:
  ShaderProgram prog_;
  GLint uModel_{-1};
  GLint uView_{-1};
  GLint uViewToLight_{-1};
  GLint uLightDir_{-1};
  GLint uLightColor_{-1};
  GLint uTex_{-1};
  GLint uLightTex_{-1};
  GLint uShadows_{-1};
  GLuint lightTex_{0};
};

} // namespace ps
