// Copyright 2025 The Spin Demos Authors
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include <glm/gtc/quaternion.hpp>
#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>

#include <numbers>

namespace spin {

// Rotation applied each frame, in radians. Speed depends on the frame rate.
constexpr float DefaultStepAngle = std::numbers::pi_v<float> / 180.0f;

// A model transform that rotates by a fixed step each frame. The step is
// composed on the right, so it rotates the model about its own axis.
class Spinner {
public:
	Spinner(glm::vec3 axis, float stepAngle)
		: Spinner{axis, stepAngle, glm::mat4{1.0f}} {}
	Spinner(glm::vec3 axis, float stepAngle, const glm::mat4 &initial);

	// Advance the transform by one frame.
	void Advance();

	const glm::mat4 &transform() const { return mTransform; }
	const glm::quat &step() const { return mStep; }
	long frames() const { return mFrames; }

private:
	glm::quat mStep;
	glm::mat4 mStepMatrix;
	glm::mat4 mTransform;
	long mFrames;
};

} // namespace spin
