// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include "gl.hpp"

#include <string_view>

namespace spin {
namespace gl_shader {

// Solid color program. Vertex attribute 0 is the position.
struct FlatProgram {
	GLuint program;
	GLint transform; // mat4
	GLint color;     // vec4
};

// Phong shaded program. Vertex attribute 0 is the position, 1 is the normal.
struct LitProgram {
	GLuint program;
	GLint transform;     // mat4
	GLint color;         // vec3
	GLint lightPosition; // vec3
	GLint viewPosition;  // vec3
};

extern FlatProgram Flat;
extern LitProgram Lit;

// Number of bytes of the info log reported when compiling or linking fails.
constexpr int InfoLogSize = 512;

// Compile all OpenGL shader programs. Any failure is fatal. The context must be
// current.
void Init();

// Delete all shader programs.
void Destroy();

// Compile a shader from source. Fails with the info log if the shader does not
// compile.
GLuint CompileShader(GLenum shaderType, std::string_view name,
                     std::string_view source);

// Link a program from a vertex and fragment shader. The shaders are detached
// afterwards. Fails with the info log if the program does not link.
GLuint LinkProgram(std::string_view name, GLuint vertex, GLuint fragment);

} // namespace gl_shader
} // namespace spin
