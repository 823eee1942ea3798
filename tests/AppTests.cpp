// Copyright 2025 The Spin Demos Authors
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "HiddenWindow.hpp"
#include "app.hpp"
#include "scene_flat_cube.hpp"
#include "scene_lit_cube.hpp"
#include "scene_triangles.hpp"
#include "var.hpp"

#include <gtest/gtest.h>

#include <array>
#include <chrono>

using namespace spin;

namespace {

// Frames the wrapped scene's spinner had advanced when the last run ended.
long LastSpinnerFrames;

// Wraps a scene and sends a key press after the first frame is rendered.
template <typename Scene, int Key>
class CloseAfterFirstFrame {
public:
	void Init() {
		LastSpinnerFrames = -1;
		mScene.Init();
	}

	void Render(const app::Context &context) {
		mScene.Render(context);
		app::KeyCallback(context.window, Key, 0, GLFW_PRESS, 0);
	}

	void Destroy() {
		LastSpinnerFrames = mScene.spinner().frames();
		mScene.Destroy();
	}

private:
	Scene mScene;
};

class AppTest : public ::testing::Test {
protected:
	void SetUp() override {
		if (!test::HiddenWindow::IsAvailable()) {
			GTEST_SKIP() << "No OpenGL display available.";
		}
	}

	void TearDown() override { ResetVars(); }

	static app::Options HiddenOptions() {
		return app::Options{.title = "Test", .visible = false};
	}
};

template <typename Scene>
class SceneTest : public AppTest {};

using SceneTypes =
	::testing::Types<scene::FlatCube, scene::Triangles, scene::LitCube>;
TYPED_TEST_SUITE(SceneTest, SceneTypes);

} // namespace

TEST(IsCloseKeyTest, EscapeAndQ) {
	EXPECT_TRUE(app::IsCloseKey(GLFW_KEY_ESCAPE, GLFW_PRESS));
	EXPECT_TRUE(app::IsCloseKey(GLFW_KEY_Q, GLFW_PRESS));
}

TEST(IsCloseKeyTest, OtherKeys) {
	EXPECT_FALSE(app::IsCloseKey(GLFW_KEY_SPACE, GLFW_PRESS));
	EXPECT_FALSE(app::IsCloseKey(GLFW_KEY_W, GLFW_PRESS));
	EXPECT_FALSE(app::IsCloseKey(GLFW_KEY_ENTER, GLFW_PRESS));
}

TEST(IsCloseKeyTest, OnlyPress) {
	EXPECT_FALSE(app::IsCloseKey(GLFW_KEY_ESCAPE, GLFW_RELEASE));
	EXPECT_FALSE(app::IsCloseKey(GLFW_KEY_Q, GLFW_REPEAT));
}

TYPED_TEST(SceneTest, EscapeClosesAfterOneFrame) {
	long frames = app::Run<CloseAfterFirstFrame<TypeParam, GLFW_KEY_ESCAPE>>(
		this->HiddenOptions());
	EXPECT_EQ(frames, 1);
	EXPECT_EQ(LastSpinnerFrames, 1);
}

TYPED_TEST(SceneTest, QClosesAfterOneFrame) {
	long frames = app::Run<CloseAfterFirstFrame<TypeParam, GLFW_KEY_Q>>(
		this->HiddenOptions());
	EXPECT_EQ(frames, 1);
}

TYPED_TEST(SceneTest, FrameLimitStopsRun) {
	char arg[] = "FrameLimit=3";
	char *args[] = {arg};
	ParseCommandArguments(1, args);
	long frames = app::Run<TypeParam>(this->HiddenOptions());
	EXPECT_EQ(frames, 3);
}

TEST_F(AppTest, StartReportsFramebufferSize) {
	app::Options options = HiddenOptions();
	options.width = 320;
	options.height = 240;
	app::Context context;
	app::Start(&context, options);
	EXPECT_NE(context.window, nullptr);
	EXPECT_GT(context.width, 0);
	EXPECT_GT(context.height, 0);
	EXPECT_EQ(context.frame, 0);
	app::EndFrame(&context, options);
	EXPECT_EQ(context.frame, 1);
	app::Finish(&context);
	EXPECT_EQ(context.window, nullptr);
}

TEST_F(AppTest, DebugContextRuns) {
	char arg[] = "DebugContext=true";
	char *args[] = {arg};
	ParseCommandArguments(1, args);
	long frames = app::Run<CloseAfterFirstFrame<scene::LitCube, GLFW_KEY_Q>>(
		HiddenOptions());
	EXPECT_EQ(frames, 1);
}

TEST_F(AppTest, FrameSleepDelaysEachFrame) {
	char arg[] = "FrameLimit=3";
	char *args[] = {arg};
	ParseCommandArguments(1, args);
	app::Options options = HiddenOptions();
	options.frameSleep = std::chrono::milliseconds{16};
	const auto start = std::chrono::steady_clock::now();
	long frames = app::Run<scene::Triangles>(options);
	const auto elapsed = std::chrono::steady_clock::now() - start;
	EXPECT_EQ(frames, 3);
	EXPECT_GE(elapsed, std::chrono::milliseconds{48});
}

TEST_F(AppTest, ResizeUpdatesContextAndViewport) {
	app::Options options = HiddenOptions();
	options.width = 320;
	options.height = 240;
	app::Context context;
	app::Start(&context, options);
	const int oldWidth = context.width;
	const int oldHeight = context.height;

	glfwSetWindowSize(context.window, 400, 300);
	// The size event arrives asynchronously from the window system.
	for (int i = 0; i < 20 && context.width == oldWidth; i++) {
		glfwWaitEventsTimeout(0.05);
	}

	int width = 0, height = 0;
	glfwGetFramebufferSize(context.window, &width, &height);
	EXPECT_NE(context.width, oldWidth);
	EXPECT_NE(context.height, oldHeight);
	EXPECT_EQ(context.width, width);
	EXPECT_EQ(context.height, height);

	std::array<GLint, 4> viewport{};
	glGetIntegerv(GL_VIEWPORT, viewport.data());
	EXPECT_EQ(viewport[0], 0);
	EXPECT_EQ(viewport[1], 0);
	EXPECT_EQ(viewport[2], context.width);
	EXPECT_EQ(viewport[3], context.height);

	app::Finish(&context);
}
