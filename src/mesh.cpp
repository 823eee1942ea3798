// Copyright 2025 The Spin Demos Authors
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "mesh.hpp"

#include "log.hpp"

#include <cstdint>
#include <limits>

namespace spin {

namespace {

constexpr GLuint PositionAttrib = 0;
constexpr GLuint NormalAttrib = 1;

void *BufferOffset(std::uintptr_t offset) {
	return reinterpret_cast<void *>(offset);
}

} // namespace

void Mesh::Init(std::span<const float> data, geometry::VertexFormat format) {
	const std::size_t vertexCount = geometry::VertexCount(data.size(), format);
	CHECK(vertexCount <= static_cast<std::size_t>(
							 std::numeric_limits<GLsizei>::max()));
	mVertexCount = static_cast<int>(vertexCount);

	glGenVertexArrays(1, &mArray);
	glBindVertexArray(mArray);
	glGenBuffers(1, &mBuffer);
	glBindBuffer(GL_ARRAY_BUFFER, mBuffer);
	glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(data.size_bytes()),
	             data.data(), GL_STATIC_DRAW);

	const GLsizei stride = static_cast<GLsizei>(
		geometry::FloatsPerVertex(format) * sizeof(float));
	glEnableVertexAttribArray(PositionAttrib);
	glVertexAttribPointer(PositionAttrib, 3, GL_FLOAT, GL_FALSE, stride,
	                      BufferOffset(0));
	if (format == geometry::VertexFormat::PositionNormal) {
		glEnableVertexAttribArray(NormalAttrib);
		glVertexAttribPointer(NormalAttrib, 3, GL_FLOAT, GL_FALSE, stride,
		                      BufferOffset(3 * sizeof(float)));
	}

	// Unbind, so later buffer calls do not modify this array by accident.
	glBindVertexArray(0);
	glBindBuffer(GL_ARRAY_BUFFER, 0);
}

void Mesh::Draw() const {
	glBindVertexArray(mArray);
	glDrawArrays(GL_TRIANGLES, 0, mVertexCount);
}

void Mesh::Destroy() {
	glDeleteVertexArrays(1, &mArray);
	mArray = 0;
	glDeleteBuffers(1, &mBuffer);
	mBuffer = 0;
	mVertexCount = 0;
}

} // namespace spin
