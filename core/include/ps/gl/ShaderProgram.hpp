#pragma once
#include <glad/gl.h>
#include <string>

namespace ps {

struct Transform;

class ShaderProgram {
public:
  ShaderProgram() = default;
  ~ShaderProgram();

  ShaderProgram(const ShaderProgram&) = delete;
  ShaderProgram& operator=(const ShaderProgram&) = delete;

  // Compile and link. Returns false on failure; the compiler or linker log
  // is kept in lastError() and printed to stderr.
  bool build(const char* vertSrc, const char* fragSrc);

  void use() const;

  GLint attribLocation(const char* name) const;
  GLint uniformLocation(const char* name) const;

  // Row-major 4x4, uploaded with transpose.
  void setUniformMat4(GLint loc, const Transform& t) const;
  void setUniformVec3(GLint loc, float x, float y, float z) const;
  void setUniformVec4(GLint loc, float x, float y, float z, float w) const;
  void setUniformFloat(GLint loc, float v) const;
  void setUniformInt(GLint loc, int v) const;

  GLuint id() const { return program_; }
  const std::string& lastError() const { return lastError_; }

private:
  GLuint program_{0};
  std::string lastError_;

  GLuint compileShader(GLenum type, const char* src);
};

} // namespace ps
