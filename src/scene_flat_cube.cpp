// Copyright 2025 The Spin Demos Authors
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "scene_flat_cube.hpp"

#include "gl_shader.hpp"
#include "log.hpp"

#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/type_ptr.hpp>
#include <glm/vec4.hpp>

#include <iterator>

namespace spin {
namespace scene {

namespace {

// Shades of red, one per face, in the same order as the box faces.
const glm::vec4 FaceColors[] = {
	{1.0f, 0.0f, 0.0f, 1.0f},   // -z
	{0.85f, 0.0f, 0.0f, 1.0f},  // +z
	{0.7f, 0.05f, 0.05f, 1.0f}, // -x
	{0.55f, 0.0f, 0.0f, 1.0f},  // +x
	{1.0f, 0.3f, 0.3f, 1.0f},   // +y
	{0.4f, 0.0f, 0.0f, 1.0f},   // -y
};

static_assert(std::size(FaceColors) * geometry::TrianglesPerFace ==
              geometry::BoxTriangleCount);

// Tilt toward the viewer so the top face is visible.
glm::mat4 InitialTilt() {
	return glm::rotate(glm::mat4{1.0f}, glm::radians(-20.0f),
	                   glm::vec3{1.0f, 0.0f, 0.0f});
}

} // namespace

FlatCube::FlatCube()
	: mSpinner{glm::vec3{0.0f, 1.0f, 0.0f}, DefaultStepAngle, InitialTilt()} {}

void FlatCube::Init() {
	std::span<const geometry::Triangle> triangles = geometry::BoxTriangles();
	CHECK(triangles.size() == mMeshes.size());
	for (std::size_t i = 0; i < mMeshes.size(); i++) {
		mMeshes[i].Init(triangles[i], geometry::VertexFormat::Position);
	}
}

void FlatCube::Render(const app::Context &context) {
	mSpinner.Advance();

	glViewport(0, 0, context.width, context.height);
	glClearColor(0.2f, 0.5f, 0.5f, 1.0f);
	glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
	glEnable(GL_DEPTH_TEST);

	const gl_shader::FlatProgram &program = gl_shader::Flat;
	glUseProgram(program.program);
	glUniformMatrix4fv(program.transform, 1, GL_FALSE,
	                   glm::value_ptr(mSpinner.transform()));
	for (std::size_t i = 0; i < mMeshes.size(); i++) {
		glUniform4fv(program.color, 1,
		             glm::value_ptr(FaceColors[i / geometry::TrianglesPerFace]));
		mMeshes[i].Draw();
	}
	glBindVertexArray(0);
}

void FlatCube::Destroy() {
	for (Mesh &mesh : mMeshes) {
		mesh.Destroy();
	}
}

} // namespace scene
} // namespace spin
