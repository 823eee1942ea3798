// Copyright 2025 The Spin Demos Authors
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include "geometry.hpp"
#include "gl.hpp"

#include <span>

namespace spin {

// Vertex data uploaded to a vertex buffer, with a vertex array object that
// binds position to attribute 0 and, if present, normal to attribute 1.
class Mesh {
public:
	Mesh() : mArray{0}, mBuffer{0}, mVertexCount{0} {}
	Mesh(const Mesh &) = delete;
	Mesh &operator=(const Mesh &) = delete;

	// Upload vertex data. The data is copied as-is.
	void Init(std::span<const float> data, geometry::VertexFormat format);

	// Draw the mesh as a list of triangles, using the current program.
	void Draw() const;

	// Delete the buffer and vertex array.
	void Destroy();

	int vertex_count() const { return mVertexCount; }
	GLuint array() const { return mArray; }
	GLuint buffer() const { return mBuffer; }

private:
	GLuint mArray;
	GLuint mBuffer;
	int mVertexCount;
};

} // namespace spin
