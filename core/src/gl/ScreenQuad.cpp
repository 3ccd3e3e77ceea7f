#include "ps/gl/ScreenQuad.hpp"

namespace ps {

const char* kScreenQuadVert = R"GLSL(
#version 330 core
in vec2 a_position;
in vec2 a_uv;
uniform float u_aspect;
out vec2 v_uv;
void main() {
    gl_Position = vec4(a_position.x / u_aspect * 2.0 - 1.0, a_position.y * 2.0 - 1.0, 0.0, 1.0);
    v_uv = a_uv;
}
)GLSL";

ScreenQuad::~ScreenQuad() {
  if (vbo_) glDeleteBuffers(1, &vbo_);
  if (vao_) glDeleteVertexArrays(1, &vao_);
}

bool ScreenQuad::init(const ShaderProgram& prog) {
  glGenVertexArrays(1, &vao_);
  glBindVertexArray(vao_);

  glGenBuffers(1, &vbo_);
  glBindBuffer(GL_ARRAY_BUFFER, vbo_);
  glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(4 * layout::kQuadStride),
               nullptr, GL_DYNAMIC_DRAW);

  GLint aPos = prog.attribLocation("a_position");
  if (aPos >= 0) {
    glEnableVertexAttribArray(static_cast<GLuint>(aPos));
    glVertexAttribPointer(static_cast<GLuint>(aPos), 2, GL_FLOAT, GL_FALSE,
                          static_cast<GLsizei>(layout::kQuadStride),
                          reinterpret_cast<const void*>(layout::kQuadPositionOffset));
  }
  GLint aUv = prog.attribLocation("a_uv");
  if (aUv >= 0) {
    glEnableVertexAttribArray(static_cast<GLuint>(aUv));
    glVertexAttribPointer(static_cast<GLuint>(aUv), 2, GL_FLOAT, GL_FALSE,
                          static_cast<GLsizei>(layout::kQuadStride),
                          reinterpret_cast<const void*>(layout::kQuadUvOffset));
  }

  glBindVertexArray(0);
  glBindBuffer(GL_ARRAY_BUFFER, 0);
  return glGetError() == GL_NO_ERROR;
}

void ScreenQuad::setCorners(const QuadVertex corners[4]) {
  auto bytes = packQuadVertices(corners, 4);
  glBindBuffer(GL_ARRAY_BUFFER, vbo_);
  glBufferSubData(GL_ARRAY_BUFFER, 0, static_cast<GLsizeiptr>(bytes.size()), bytes.data());
  glBindBuffer(GL_ARRAY_BUFFER, 0);
}

void ScreenQuad::setRect(float x, float y, float w, float h) {
  // Texture rows run top to bottom.
  const QuadVertex corners[4] = {
    {x,     y,     0.0f, 1.0f},
    {x + w, y,     1.0f, 1.0f},
    {x,     y + h, 0.0f, 0.0f},
    {x + w, y + h, 1.0f, 0.0f},
  };
  setCorners(corners);
}

void ScreenQuad::draw() const {
  glBindVertexArray(vao_);
  glDrawArrays(GL_TRIANGLE_STRIP, 0, 4);
  glBindVertexArray(0);
}

} // namespace ps
