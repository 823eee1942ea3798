// Copyright 2025 The Spin Demos Authors
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "scene_lit_cube.hpp"

#include "geometry.hpp"
#include "gl_shader.hpp"

#include <glm/gtc/type_ptr.hpp>
#include <glm/vec3.hpp>

namespace spin {
namespace scene {

namespace {

// There is no projection, so the viewer looks down +z from the near plane.
const glm::vec3 ViewPosition{0.0f, 0.0f, -3.0f};
const glm::vec3 LightPosition{1.2f, 1.0f, -2.0f};
const glm::vec3 CubeColor{1.0f, 0.5f, 0.31f};

} // namespace

LitCube::LitCube()
	: mSpinner{glm::vec3{0.5f, 1.0f, 0.0f}, DefaultStepAngle} {}

void LitCube::Init() {
	mMesh.Init(geometry::NormalCubeVertices(),
	           geometry::VertexFormat::PositionNormal);

	// These never change, so set them once.
	const gl_shader::LitProgram &program = gl_shader::Lit;
	glUseProgram(program.program);
	glUniform3fv(program.color, 1, glm::value_ptr(CubeColor));
	glUniform3fv(program.lightPosition, 1, glm::value_ptr(LightPosition));
	glUniform3fv(program.viewPosition, 1, glm::value_ptr(ViewPosition));
	glUseProgram(0);
}

void LitCube::Render(const app::Context &context) {
	mSpinner.Advance();

	glViewport(0, 0, context.width, context.height);
	glClearColor(0.2f, 0.5f, 0.5f, 1.0f);
	glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
	glEnable(GL_DEPTH_TEST);

	const gl_shader::LitProgram &program = gl_shader::Lit;
	glUseProgram(program.program);
	glUniformMatrix4fv(program.transform, 1, GL_FALSE,
	                   glm::value_ptr(mSpinner.transform()));
	mMesh.Draw();
	glBindVertexArray(0);
}

void LitCube::Destroy() {
	mMesh.Destroy();
}

} // namespace scene
} // namespace spin
