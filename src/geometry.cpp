// Copyright 2025 The Spin Demos Authors
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "geometry.hpp"

namespace spin {
namespace geometry {

namespace {

// Box corners. L/R is x, 1/2 is top/bottom, 1-2/3-4 is back/front.
constexpr Point L1{-0.5f, 0.25f, -0.5f};
constexpr Point L2{-0.5f, -0.25f, -0.5f};
constexpr Point L3{-0.5f, 0.25f, 0.5f};
constexpr Point L4{-0.5f, -0.25f, 0.5f};
constexpr Point R1{0.5f, 0.25f, -0.5f};
constexpr Point R2{0.5f, -0.25f, -0.5f};
constexpr Point R3{0.5f, 0.25f, 0.5f};
constexpr Point R4{0.5f, -0.25f, 0.5f};

constexpr std::array<Triangle, BoxTriangleCount> Box = {
	// -z
	MakeTriangle(L1, L2, R2),
	MakeTriangle(L1, R1, R2),
	// +z
	MakeTriangle(L3, L4, R4),
	MakeTriangle(L3, R3, R4),
	// -x
	MakeTriangle(L1, L2, L4),
	MakeTriangle(L1, L3, L4),
	// +x
	MakeTriangle(R1, R2, R4),
	MakeTriangle(R1, R3, R4),
	// +y
	MakeTriangle(L1, R1, R3),
	MakeTriangle(L1, L3, R3),
	// -y
	MakeTriangle(L2, R2, R4),
	MakeTriangle(L2, L4, R4),
};

constexpr std::array<Triangle, SideBySideTriangleCount> SideBySide = {
	MakeTriangle({-0.9f, -0.5f, 0.0f}, {-0.1f, -0.5f, 0.0f},
	             {-0.5f, 0.5f, 0.0f}),
	MakeTriangle({0.1f, -0.5f, 0.0f}, {0.9f, -0.5f, 0.0f},
	             {0.5f, 0.5f, 0.0f}),
};

const float NormalCube[36 * 6] = {
	// -z
	-0.5f, -0.5f, -0.5f, 0.0f, 0.0f, -1.0f, //
	+0.5f, +0.5f, -0.5f, 0.0f, 0.0f, -1.0f, //
	+0.5f, -0.5f, -0.5f, 0.0f, 0.0f, -1.0f, //
	+0.5f, +0.5f, -0.5f, 0.0f, 0.0f, -1.0f, //
	-0.5f, -0.5f, -0.5f, 0.0f, 0.0f, -1.0f, //
	-0.5f, +0.5f, -0.5f, 0.0f, 0.0f, -1.0f, //
	// +z
	-0.5f, -0.5f, +0.5f, 0.0f, 0.0f, 1.0f, //
	+0.5f, -0.5f, +0.5f, 0.0f, 0.0f, 1.0f, //
	+0.5f, +0.5f, +0.5f, 0.0f, 0.0f, 1.0f, //
	+0.5f, +0.5f, +0.5f, 0.0f, 0.0f, 1.0f, //
	-0.5f, +0.5f, +0.5f, 0.0f, 0.0f, 1.0f, //
	-0.5f, -0.5f, +0.5f, 0.0f, 0.0f, 1.0f, //
	// -x
	-0.5f, +0.5f, +0.5f, -1.0f, 0.0f, 0.0f, //
	-0.5f, +0.5f, -0.5f, -1.0f, 0.0f, 0.0f, //
	-0.5f, -0.5f, -0.5f, -1.0f, 0.0f, 0.0f, //
	-0.5f, -0.5f, -0.5f, -1.0f, 0.0f, 0.0f, //
	-0.5f, -0.5f, +0.5f, -1.0f, 0.0f, 0.0f, //
	-0.5f, +0.5f, +0.5f, -1.0f, 0.0f, 0.0f, //
	// +x
	+0.5f, +0.5f, +0.5f, 1.0f, 0.0f, 0.0f, //
	+0.5f, -0.5f, -0.5f, 1.0f, 0.0f, 0.0f, //
	+0.5f, +0.5f, -0.5f, 1.0f, 0.0f, 0.0f, //
	+0.5f, -0.5f, -0.5f, 1.0f, 0.0f, 0.0f, //
	+0.5f, +0.5f, +0.5f, 1.0f, 0.0f, 0.0f, //
	+0.5f, -0.5f, +0.5f, 1.0f, 0.0f, 0.0f, //
	// -y
	-0.5f, -0.5f, -0.5f, 0.0f, -1.0f, 0.0f, //
	+0.5f, -0.5f, -0.5f, 0.0f, -1.0f, 0.0f, //
	+0.5f, -0.5f, +0.5f, 0.0f, -1.0f, 0.0f, //
	+0.5f, -0.5f, +0.5f, 0.0f, -1.0f, 0.0f, //
	-0.5f, -0.5f, +0.5f, 0.0f, -1.0f, 0.0f, //
	-0.5f, -0.5f, -0.5f, 0.0f, -1.0f, 0.0f, //
	// +y
	-0.5f, +0.5f, -0.5f, 0.0f, 1.0f, 0.0f, //
	+0.5f, +0.5f, +0.5f, 0.0f, 1.0f, 0.0f, //
	+0.5f, +0.5f, -0.5f, 0.0f, 1.0f, 0.0f, //
	+0.5f, +0.5f, +0.5f, 0.0f, 1.0f, 0.0f, //
	-0.5f, +0.5f, -0.5f, 0.0f, 1.0f, 0.0f, //
	-0.5f, +0.5f, +0.5f, 0.0f, 1.0f, 0.0f, //
};

} // namespace

std::span<const Triangle> BoxTriangles() {
	return Box;
}

std::span<const Triangle> SideBySideTriangles() {
	return SideBySide;
}

std::span<const float> NormalCubeVertices() {
	return NormalCube;
}

} // namespace geometry
} // namespace spin
