// Copyright 2025 The Spin Demos Authors
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "scene_triangles.hpp"

#include "gl_shader.hpp"
#include "log.hpp"

#include <glm/gtc/type_ptr.hpp>
#include <glm/vec4.hpp>

namespace spin {
namespace scene {

namespace {

const glm::vec4 TriangleColors[geometry::SideBySideTriangleCount] = {
	{1.0f, 0.5f, 0.2f, 1.0f},
	{0.2f, 0.3f, 0.9f, 1.0f},
};

} // namespace

Triangles::Triangles()
	: mSpinner{glm::vec3{0.0f, 0.0f, 1.0f}, DefaultStepAngle} {}

void Triangles::Init() {
	std::span<const geometry::Triangle> triangles =
		geometry::SideBySideTriangles();
	CHECK(triangles.size() == mMeshes.size());
	for (std::size_t i = 0; i < mMeshes.size(); i++) {
		mMeshes[i].Init(triangles[i], geometry::VertexFormat::Position);
	}
}

void Triangles::Render(const app::Context &context) {
	mSpinner.Advance();

	glViewport(0, 0, context.width, context.height);
	glClearColor(0.2f, 0.5f, 0.5f, 1.0f);
	glClear(GL_COLOR_BUFFER_BIT);

	const gl_shader::FlatProgram &program = gl_shader::Flat;
	glUseProgram(program.program);
	glUniformMatrix4fv(program.transform, 1, GL_FALSE,
	                   glm::value_ptr(mSpinner.transform()));
	for (std::size_t i = 0; i < mMeshes.size(); i++) {
		glUniform4fv(program.color, 1, glm::value_ptr(TriangleColors[i]));
		mMeshes[i].Draw();
	}
	glBindVertexArray(0);
}

void Triangles::Destroy() {
	for (Mesh &mesh : mMeshes) {
		mesh.Destroy();
	}
}

} // namespace scene
} // namespace spin
