// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "gl_shader.hpp"

#include "gl_shader_data.hpp"
#include "log.hpp"
#include "os_file.hpp"
#include "var.hpp"

#include <array>
#include <limits>
#include <string>
#include <vector>

namespace spin {
namespace gl_shader {

namespace {

using GetParamFunc = void(APIENTRY *)(GLuint object, GLenum pname,
                                      GLint *params);
using GetInfoLogFunc = void(APIENTRY *)(GLuint object, GLsizei bufSize,
                                        GLsizei *length, GLchar *infoLog);

// Check the status of a shader or program object, and fail with the first part
// of the info log if the status is false.
void CheckStatus(GLuint object, GLenum statusParam, GetParamFunc getParam,
                 GetInfoLogFunc getInfoLog, std::string_view message,
                 std::string_view name) {
	GLint status = GL_FALSE;
	getParam(object, statusParam, &status);
	if (status) {
		return;
	}
	char infoLog[InfoLogSize];
	GLsizei length = 0;
	getInfoLog(object, InfoLogSize, &length, infoLog);
	if (length < 0) {
		length = 0;
	}
	FAIL(message, log::Attr{"name", name},
	     log::Attr{"log", std::string_view{infoLog,
	                                       static_cast<std::size_t>(length)}});
}

// Source text for all shaders. The strings either point into the embedded
// shader text or into file data.
class SourceSet {
public:
	// Use the shaders embedded in the executable.
	void LoadEmbedded() {
		std::array<ShaderSource, ShaderCount> sources =
			GetEmbeddedShaderSource();
		for (int i = 0; i < ShaderCount; i++) {
			mText[i] = sources[i].text();
		}
		LOG(Debug, "Using embedded shaders.");
	}

	// Read the shaders from the project directory.
	void LoadFiles() {
		std::string filename;
		for (int i = 0; i < ShaderCount; i++) {
			filename.assign("shader/");
			filename.append(ShaderNames[i]);
			std::vector<unsigned char> &data = mData[i];
			if (!ReadFile(&data, filename)) {
				FAIL("Could not read shader.", log::Attr{"file", filename});
			}
			mText[i] = std::string_view{
				reinterpret_cast<const char *>(data.data()), data.size()};
		}
		LOG(Info, "Loaded shaders from project directory.",
		    log::Attr{"path", var::ProjectPath.get()});
	}

	std::string_view text(int shaderId) const { return mText[shaderId]; }

private:
	std::array<std::vector<unsigned char>, ShaderCount> mData;
	std::array<std::string_view, ShaderCount> mText;
};

GLint GetUniform(GLuint program, const char *name) {
	GLint location = glGetUniformLocation(program, name);
	if (location < 0) {
		LOG(Warn, "Uniform is not active.", log::Attr{"name", name});
	}
	return location;
}

} // namespace

FlatProgram Flat;
LitProgram Lit;

GLuint CompileShader(GLenum shaderType, std::string_view name,
                     std::string_view source) {
	GLuint shader = glCreateShader(shaderType);
	if (shader == 0) {
		FAIL("Could not create shader.", log::Attr{"name", name});
	}

	CHECK(source.size() <= std::numeric_limits<GLint>::max());
	const char *srcText[1] = {source.data()};
	const GLint srcLen[1] = {static_cast<GLint>(source.size())};
	glShaderSource(shader, 1, srcText, srcLen);
	glCompileShader(shader);
	CheckStatus(shader, GL_COMPILE_STATUS, glGetShaderiv, glGetShaderInfoLog,
	            "Shader failed to compile.", name);
	return shader;
}

GLuint LinkProgram(std::string_view name, GLuint vertex, GLuint fragment) {
	GLuint program = glCreateProgram();
	if (program == 0) {
		FAIL("Could not create shader program.", log::Attr{"name", name});
	}

	glAttachShader(program, vertex);
	glAttachShader(program, fragment);
	glLinkProgram(program);
	CheckStatus(program, GL_LINK_STATUS, glGetProgramiv, glGetProgramInfoLog,
	            "Shader program failed to link.", name);
	glDetachShader(program, vertex);
	glDetachShader(program, fragment);
	return program;
}

void Init() {
	SourceSet sources;
	if (var::ProjectPath.get().empty()) {
		sources.LoadEmbedded();
	} else {
		sources.LoadFiles();
	}

	std::array<GLuint, ShaderCount> shaders;
	for (int shaderId = 0; shaderId < ShaderCount; shaderId++) {
		shaders[shaderId] = CompileShader(
			shaderId < VertexShaderCount ? GL_VERTEX_SHADER
		                                 : GL_FRAGMENT_SHADER,
			ShaderNames[shaderId], sources.text(shaderId));
	}

	std::array<GLuint, ProgramCount> programs;
	for (int programId = 0; programId < ProgramCount; programId++) {
		const ProgramSpec &spec = ProgramSpecs[programId];
		programs[programId] = LinkProgram(spec.name, shaders[spec.vertex],
		                                  shaders[spec.fragment]);
	}

	// Shader objects are not needed once they are linked into programs.
	for (GLuint shader : shaders) {
		glDeleteShader(shader);
	}

	GLuint program = programs[FlatProgramIndex];
	Flat.program = program;
	Flat.transform = GetUniform(program, "transform");
	Flat.color = GetUniform(program, "color");

	program = programs[LitProgramIndex];
	Lit.program = program;
	Lit.transform = GetUniform(program, "transform");
	Lit.color = GetUniform(program, "color");
	Lit.lightPosition = GetUniform(program, "lightPosition");
	Lit.viewPosition = GetUniform(program, "viewPosition");

	LOG(Debug, "Shaders ready.", log::Attr{"programs", ProgramCount});
}

void Destroy() {
	glDeleteProgram(Flat.program);
	Flat = FlatProgram{};
	glDeleteProgram(Lit.program);
	Lit = LitProgram{};
}

} // namespace gl_shader
} // namespace spin
