// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "gl_shader_data.hpp"

#include <cstring>

namespace spin {
namespace gl_shader {

// Generated by cmake/EmbedShaders.cmake.
extern const char ShaderText[];

extern const std::array<std::string_view, ShaderCount> ShaderNames = {{
	"flat.vert",
	"lit.vert",
	"flat.frag",
	"lit.frag",
}};

std::array<ShaderSource, ShaderCount> GetEmbeddedShaderSource() {
	std::array<ShaderSource, ShaderCount> shaders;
	const char *ptr = ShaderText;
	for (auto &shader : shaders) {
		std::size_t length = std::strlen(ptr);
		shader.ptr = ptr;
		shader.size = static_cast<int>(length);
		ptr += length + 1;
	}
	return shaders;
}

extern const std::array<ProgramSpec, ProgramCount> ProgramSpecs = {{
	{"flat", 0, 2},
	{"lit", 1, 3},
}};

} // namespace gl_shader
} // namespace spin
