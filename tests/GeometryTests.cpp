// Copyright 2025 The Spin Demos Authors
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "geometry.hpp"

#include <glm/geometric.hpp>
#include <glm/vec3.hpp>

#include <gtest/gtest.h>

#include <cmath>

using namespace spin;
using namespace spin::geometry;

namespace {

glm::vec3 PointAt(std::span<const float> data, std::size_t vertex,
                  VertexFormat format) {
	const std::size_t i = vertex * FloatsPerVertex(format);
	return {data[i], data[i + 1], data[i + 2]};
}

glm::vec3 NormalAt(std::span<const float> data, std::size_t vertex) {
	const std::size_t i = vertex * 6 + 3;
	return {data[i], data[i + 1], data[i + 2]};
}

} // namespace

// =============================================================================
// Vertex layout
// =============================================================================

TEST(GeometryTest, FloatsPerVertexMatchesFormat) {
	EXPECT_EQ(FloatsPerVertex(VertexFormat::Position), 3);
	EXPECT_EQ(FloatsPerVertex(VertexFormat::PositionNormal), 6);
}

TEST(GeometryTest, VertexCountDividesByStride) {
	EXPECT_EQ(VertexCount(9, VertexFormat::Position), 3u);
	EXPECT_EQ(VertexCount(216, VertexFormat::PositionNormal), 36u);
	EXPECT_EQ(VertexCount(0, VertexFormat::Position), 0u);
	// Leftover floats are not validated, just dropped.
	EXPECT_EQ(VertexCount(11, VertexFormat::Position), 3u);
	EXPECT_EQ(VertexCount(11, VertexFormat::PositionNormal), 1u);
}

TEST(GeometryTest, MakeTriangleConcatenatesPointsInOrder) {
	const Triangle t = MakeTriangle({1, 2, 3}, {4, 5, 6}, {7, 8, 9});
	for (int i = 0; i < 9; i++) {
		EXPECT_EQ(t[i], static_cast<float>(i + 1));
	}
}

// =============================================================================
// Literal arrays
// =============================================================================

TEST(GeometryTest, BoxHasTwoTrianglesPerFace) {
	std::span<const Triangle> box = BoxTriangles();
	ASSERT_EQ(box.size(), static_cast<std::size_t>(BoxTriangleCount));
	EXPECT_EQ(box.size(), 6u * TrianglesPerFace);
	for (const Triangle &t : box) {
		EXPECT_EQ(VertexCount(t.size(), VertexFormat::Position), 3u);
	}
}

TEST(GeometryTest, BoxTrianglesLieOnBoxFaces) {
	const glm::vec3 extent{0.5f, 0.25f, 0.5f};
	for (const Triangle &t : BoxTriangles()) {
		// Every vertex is a corner of the box.
		for (std::size_t v = 0; v < 3; v++) {
			const glm::vec3 p = PointAt(t, v, VertexFormat::Position);
			for (int axis = 0; axis < 3; axis++) {
				EXPECT_EQ(std::abs(p[axis]), extent[axis]);
			}
		}
		// All three vertices share one coordinate, so the triangle is flat
		// against a face.
		const glm::vec3 a = PointAt(t, 0, VertexFormat::Position);
		const glm::vec3 b = PointAt(t, 1, VertexFormat::Position);
		const glm::vec3 c = PointAt(t, 2, VertexFormat::Position);
		int sharedAxes = 0;
		for (int axis = 0; axis < 3; axis++) {
			if (a[axis] == b[axis] && b[axis] == c[axis]) {
				sharedAxes++;
			}
		}
		EXPECT_EQ(sharedAxes, 1);
	}
}

TEST(GeometryTest, BoxKeepsFrontAndBackFacesFirst) {
	std::span<const Triangle> box = BoxTriangles();
	const Triangle expected = MakeTriangle(
		{-0.5f, 0.25f, -0.5f}, {-0.5f, -0.25f, -0.5f}, {0.5f, -0.25f, -0.5f});
	EXPECT_EQ(box[0], expected);
	for (int i = 0; i < 2; i++) {
		EXPECT_EQ(box[i][2], -0.5f);
		EXPECT_EQ(box[2 + i][2], 0.5f);
	}
}

TEST(GeometryTest, SideBySideTrianglesAreDisjoint) {
	std::span<const Triangle> triangles = SideBySideTriangles();
	ASSERT_EQ(triangles.size(),
	          static_cast<std::size_t>(SideBySideTriangleCount));
	for (std::size_t v = 0; v < 3; v++) {
		EXPECT_LT(PointAt(triangles[0], v, VertexFormat::Position).x, 0.0f);
		EXPECT_GT(PointAt(triangles[1], v, VertexFormat::Position).x, 0.0f);
	}
}

TEST(GeometryTest, NormalCubeHasThirtySixVertices) {
	std::span<const float> data = NormalCubeVertices();
	EXPECT_EQ(data.size(), 36u * 6u);
	EXPECT_EQ(VertexCount(data.size(), VertexFormat::PositionNormal), 36u);
}

TEST(GeometryTest, NormalCubeNormalsPointOutOfFaces) {
	std::span<const float> data = NormalCubeVertices();
	const std::size_t count =
		VertexCount(data.size(), VertexFormat::PositionNormal);
	for (std::size_t v = 0; v < count; v++) {
		const glm::vec3 p = PointAt(data, v, VertexFormat::PositionNormal);
		const glm::vec3 n = NormalAt(data, v);
		EXPECT_FLOAT_EQ(glm::length(n), 1.0f) << "vertex " << v;
		EXPECT_FLOAT_EQ(glm::dot(p, n), 0.5f) << "vertex " << v;
	}
}

TEST(GeometryTest, NormalCubeIsWoundCounterClockwise) {
	std::span<const float> data = NormalCubeVertices();
	for (std::size_t v = 0; v < 36; v += 3) {
		const glm::vec3 a = PointAt(data, v, VertexFormat::PositionNormal);
		const glm::vec3 b = PointAt(data, v + 1, VertexFormat::PositionNormal);
		const glm::vec3 c = PointAt(data, v + 2, VertexFormat::PositionNormal);
		const glm::vec3 faceNormal = glm::normalize(glm::cross(b - a, c - a));
		EXPECT_GT(glm::dot(faceNormal, NormalAt(data, v)), 0.99f)
			<< "triangle " << v / 3;
	}
}
