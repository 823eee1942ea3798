// Copyright 2025 The Spin Demos Authors
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include "app.hpp"
#include "geometry.hpp"
#include "mesh.hpp"
#include "spinner.hpp"

#include <array>

namespace spin {
namespace scene {

// A box spinning about its vertical axis, with a solid color for each face.
// Each triangle has its own vertex buffer.
class FlatCube {
public:
	FlatCube();
	FlatCube(const FlatCube &) = delete;
	FlatCube &operator=(const FlatCube &) = delete;

	void Init();
	void Render(const app::Context &context);
	void Destroy();

	const Spinner &spinner() const { return mSpinner; }

private:
	Spinner mSpinner;
	std::array<Mesh, geometry::BoxTriangleCount> mMeshes;
};

} // namespace scene
} // namespace spin
