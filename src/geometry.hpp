// Copyright 2025 The Spin Demos Authors
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

// Vertex data for the demos. Triangles are listed one after another with no
// index buffer, so vertices on shared edges are repeated.

#include <array>
#include <cstddef>
#include <span>

namespace spin {
namespace geometry {

// Layout of the floats for a single vertex.
enum class VertexFormat {
	Position,       // x, y, z
	PositionNormal, // x, y, z, nx, ny, nz
};

// Return the number of floats in each vertex.
constexpr int FloatsPerVertex(VertexFormat format) {
	return format == VertexFormat::PositionNormal ? 6 : 3;
}

// Return the number of vertices in an array with the given number of floats.
// Any leftover floats are not part of a vertex.
constexpr std::size_t VertexCount(std::size_t floatCount, VertexFormat format) {
	return floatCount / FloatsPerVertex(format);
}

using Point = std::array<float, 3>;
using Triangle = std::array<float, 9>;

// Concatenate three points into a triangle.
constexpr Triangle MakeTriangle(const Point &a, const Point &b,
                                const Point &c) {
	return {a[0], a[1], a[2], b[0], b[1], b[2], c[0], c[1], c[2]};
}

// Number of triangles in each face of a box.
constexpr int TrianglesPerFace = 2;

constexpr int BoxTriangleCount = 12;

// Triangles of a 1.0 x 0.5 x 1.0 box centered on the origin, two per face.
// Faces are in the order -z, +z, -x, +x, +y, -y.
std::span<const Triangle> BoxTriangles();

constexpr int SideBySideTriangleCount = 2;

// Two separate triangles, side by side in the z=0 plane.
std::span<const Triangle> SideBySideTriangles();

// Unit cube centered on the origin with a normal for each vertex, in
// PositionNormal format. Faces are wound counter-clockwise from outside.
std::span<const float> NormalCubeVertices();

} // namespace geometry
} // namespace spin
