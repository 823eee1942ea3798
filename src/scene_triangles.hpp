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

// Two triangles, each in its own buffer, turning together about the z axis.
class Triangles {
public:
	Triangles();
	Triangles(const Triangles &) = delete;
	Triangles &operator=(const Triangles &) = delete;

	void Init();
	void Render(const app::Context &context);
	void Destroy();

	const Spinner &spinner() const { return mSpinner; }

private:
	Spinner mSpinner;
	std::array<Mesh, geometry::SideBySideTriangleCount> mMeshes;
};

} // namespace scene
} // namespace spin
