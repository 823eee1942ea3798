// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include <array>
#include <string_view>

namespace spin {
namespace gl_shader {

// Vertex shaders come first, then fragment shaders. The order must match
// SPIN_SHADERS in CMakeLists.txt.
constexpr int ShaderCount = 4;
constexpr int VertexShaderCount = 2;
constexpr int ProgramCount = 2;

// File names of the shaders, relative to the shader directory.
extern const std::array<std::string_view, ShaderCount> ShaderNames;

// The source code for a shader.
struct ShaderSource {
	const char *ptr;
	int size;

	std::string_view text() const {
		return {ptr, static_cast<std::size_t>(size)};
	}
};

// Get the source code for shaders embedded in the program.
std::array<ShaderSource, ShaderCount> GetEmbeddedShaderSource();

// Specification for a shader program.
struct ProgramSpec {
	std::string_view name;
	int vertex;   // Index into shader array.
	int fragment; // Index into shader array.
};

// Specifications for all programs.
extern const std::array<ProgramSpec, ProgramCount> ProgramSpecs;

// Indexes into ProgramSpecs.
constexpr int FlatProgramIndex = 0;
constexpr int LitProgramIndex = 1;

} // namespace gl_shader
} // namespace spin
