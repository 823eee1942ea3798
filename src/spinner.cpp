// Copyright 2025 The Spin Demos Authors
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "spinner.hpp"

#include "log.hpp"

#include <glm/geometric.hpp>

namespace spin {

Spinner::Spinner(glm::vec3 axis, float stepAngle, const glm::mat4 &initial)
	: mStep{1.0f, 0.0f, 0.0f, 0.0f}, mStepMatrix{1.0f}, mTransform{initial},
	  mFrames{0} {
	CHECK(glm::length(axis) > 0.0f);
	mStep = glm::angleAxis(stepAngle, glm::normalize(axis));
	mStepMatrix = glm::mat4_cast(mStep);
}

void Spinner::Advance() {
	mTransform = mTransform * mStepMatrix;
	mFrames++;
}

} // namespace spin
