#include "ps/gl/ShaderProgram.hpp"
#include "ps/math/Transform.hpp"
#include <cstdio>
#include <vector>

namespace ps {

ShaderProgram::~ShaderProgram() {
  if (program_) {
    glDeleteProgram(program_);
  }
}

GLuint ShaderProgram::compileShader(GLenum type, const char* src) {
  GLuint s = glCreateShader(type);
  glShaderSource(s, 1, &src, nullptr);
  glCompileShader(s);

  GLint ok = 0;
  glGetShaderiv(s, GL_COMPILE_STATUS, &ok);
  if (!ok) {
    GLint len = 0;
    glGetShaderiv(s, GL_INFO_LOG_LENGTH, &len);
    std::vector<char> log(static_cast<std::size_t>(len > 1 ? len : 1), '\0');
    glGetShaderInfoLog(s, len, nullptr, log.data());
    lastError_ = std::string(type == GL_VERTEX_SHADER ? "vertex" : "fragment") +
                 " shader compile error: " + log.data();
    std::fprintf(stderr, "ShaderProgram: %s\n", lastError_.c_str());
    glDeleteShader(s);
    return 0;
  }
  return s;
}

bool ShaderProgram::build(const char* vertSrc, const char* fragSrc) {
  lastError_.clear();
  if (program_) {
    glDeleteProgram(program_);
    program_ = 0;
  }

  GLuint vs = compileShader(GL_VERTEX_SHADER, vertSrc);
  if (!vs) return false;

  GLuint fs = compileShader(GL_FRAGMENT_SHADER, fragSrc);
  if (!fs) { glDeleteShader(vs); return false; }

  program_ = glCreateProgram();
  glAttachShader(program_, vs);
  glAttachShader(program_, fs);
  glLinkProgram(program_);

  glDetachShader(program_, vs);
  glDetachShader(program_, fs);
  glDeleteShader(vs);
  glDeleteShader(fs);

  GLint ok = 0;
  glGetProgramiv(program_, GL_LINK_STATUS, &ok);
  if (!ok) {
    GLint len = 0;
    glGetProgramiv(program_, GL_INFO_LOG_LENGTH, &len);
    std::vector<char> log(static_cast<std::size_t>(len > 1 ? len : 1), '\0');
    glGetProgramInfoLog(program_, len, nullptr, log.data());
    lastError_ = std::string("program link error: ") + log.data();
    std::fprintf(stderr, "ShaderProgram: %s\n", lastError_.c_str());
    glDeleteProgram(program_);
    program_ = 0;
    return false;
  }
  return true;
}

void ShaderProgram::use() const {
  glUseProgram(program_);
}

GLint ShaderProgram::attribLocation(const char* name) const {
  return glGetAttribLocation(program_, name);
}

GLint ShaderProgram::uniformLocation(const char* name) const {
  return glGetUniformLocation(program_, name);
}

void ShaderProgram::setUniformMat4(GLint loc, const Transform& t) const {
  glUniformMatrix4fv(loc, 1, GL_TRUE, t.data());
}

void ShaderProgram::setUniformVec3(GLint loc, float x, float y, float z) const {
  glUniform3f(loc, x, y, z);
}

void ShaderProgram::setUniformVec4(GLint loc, float x, float y, float z, float w) const {
  glUniform4f(loc, x, y, z, w);
}

void ShaderProgram::setUniformFloat(GLint loc, float v) const {
  glUniform1f(loc, v);
}

void ShaderProgram::setUniformInt(GLint loc, int v) const {
  glUniform1i(loc, v);
}

} // namespace ps
