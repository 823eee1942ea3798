// Copyright 2025 The Spin Demos Authors
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "spinner.hpp"

#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>

#include <gtest/gtest.h>

#include <cmath>

using namespace spin;

namespace {

// Largest absolute difference between two matrices.
float MaxDifference(const glm::mat4 &a, const glm::mat4 &b) {
	float result = 0.0f;
	for (int col = 0; col < 4; col++) {
		for (int row = 0; row < 4; row++) {
			result = std::fmax(result, std::fabs(a[col][row] - b[col][row]));
		}
	}
	return result;
}

const glm::vec3 YAxis{0.0f, 1.0f, 0.0f};

glm::mat4 Tilt() {
	return glm::rotate(glm::mat4{1.0f}, glm::radians(30.0f),
	                   glm::vec3{1.0f, 0.0f, 0.0f});
}

} // namespace

TEST(SpinnerTest, StartsAtInitialTransform) {
	Spinner spinner{YAxis, DefaultStepAngle, Tilt()};
	EXPECT_EQ(spinner.frames(), 0);
	EXPECT_EQ(MaxDifference(spinner.transform(), Tilt()), 0.0f);

	Spinner identity{YAxis, DefaultStepAngle};
	EXPECT_EQ(MaxDifference(identity.transform(), glm::mat4{1.0f}), 0.0f);
}

TEST(SpinnerTest, StepIsUnitQuaternionForAxisAndAngle) {
	// The axis does not need to be normalized.
	Spinner spinner{glm::vec3{0.0f, 3.0f, 0.0f}, DefaultStepAngle};
	const glm::quat step = spinner.step();
	EXPECT_NEAR(glm::length(step), 1.0f, 1e-6f);
	EXPECT_NEAR(glm::angle(step), DefaultStepAngle, 1e-5f);
	const glm::vec3 axis = glm::axis(step);
	EXPECT_NEAR(axis.x, 0.0f, 1e-5f);
	EXPECT_NEAR(axis.y, 1.0f, 1e-5f);
	EXPECT_NEAR(axis.z, 0.0f, 1e-5f);
}

TEST(SpinnerTest, AdvanceCountsFrames) {
	Spinner spinner{YAxis, DefaultStepAngle};
	for (int i = 0; i < 5; i++) {
		spinner.Advance();
	}
	EXPECT_EQ(spinner.frames(), 5);
}

TEST(SpinnerTest, NFramesComposeNStepsOnTheRight) {
	constexpr int Frames = 90;
	Spinner spinner{YAxis, DefaultStepAngle, Tilt()};
	for (int i = 0; i < Frames; i++) {
		spinner.Advance();
	}

	const glm::mat4 rotation =
		glm::mat4_cast(glm::angleAxis(Frames * DefaultStepAngle, YAxis));
	const glm::mat4 expected = Tilt() * rotation;
	EXPECT_LT(MaxDifference(spinner.transform(), expected), 1e-4f);

	// Composing on the left gives a different result, since the tilt and the
	// spin do not commute.
	const glm::mat4 wrongOrder = rotation * Tilt();
	EXPECT_GT(MaxDifference(spinner.transform(), wrongOrder), 0.1f);
}

TEST(SpinnerTest, MatchesRepeatedStepMultiplication) {
	Spinner spinner{glm::vec3{0.5f, 1.0f, 0.0f}, DefaultStepAngle};
	glm::mat4 expected{1.0f};
	const glm::mat4 step = glm::mat4_cast(spinner.step());
	for (int i = 0; i < 200; i++) {
		spinner.Advance();
		expected = expected * step;
	}
	EXPECT_EQ(MaxDifference(spinner.transform(), expected), 0.0f);
}

TEST(SpinnerTest, FullTurnReturnsToStart) {
	Spinner spinner{YAxis, DefaultStepAngle, Tilt()};
	for (int i = 0; i < 360; i++) {
		spinner.Advance();
	}
	EXPECT_LT(MaxDifference(spinner.transform(), Tilt()), 1e-3f);
}

TEST(SpinnerDeathTest, ZeroAxisFails) {
	EXPECT_EXIT((Spinner{glm::vec3{0.0f}, DefaultStepAngle}),
	            ::testing::ExitedWithCode(1), "Check failed");
}
