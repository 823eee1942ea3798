// Copyright 2025 The Spin Demos Authors
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include "app.hpp"
#include "mesh.hpp"
#include "spinner.hpp"

namespace spin {
namespace scene {

// A cube with Phong lighting, tumbling about a diagonal axis.
class LitCube {
public:
	LitCube();
	LitCube(const LitCube &) = delete;
	LitCube &operator=(const LitCube &) = delete;

	void Init();
	void Render(const app::Context &context);
	void Destroy();

	const Spinner &spinner() const { return mSpinner; }

private:
	Spinner mSpinner;
	Mesh mMesh;
};

} // namespace scene
} // namespace spin
