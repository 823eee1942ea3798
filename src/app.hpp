// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include "gl.hpp"

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

#include <chrono>
#include <string_view>

namespace spin {
namespace app {

// Exits the program with an error status code.
[[noreturn]]
void ExitError();

// Settings for a demo window.
struct Options {
	std::string_view title;
	int width = 800;
	int height = 800;
	// Extra delay after presenting each frame.
	std::chrono::milliseconds frameSleep{0};
	// Show the window. Hidden windows are used by tests.
	bool visible = true;
};

// State for the open window. Callbacks update it, and it is passed to the
// scene every frame.
struct Context {
	GLFWwindow *window = nullptr;
	int width = 0; // Framebuffer size, in pixels.
	int height = 0;
	long frame = 0; // Number of frames presented.
};

// Return true if the key event should close the window.
bool IsCloseKey(int key, int action);

// Handle a key event for the window. Escape or Q closes the window.
void KeyCallback(GLFWwindow *window, int key, int scancode, int action,
                 int mods);

// Initialize GLFW, create the window, and initialize OpenGL state shared by
// all scenes. Any failure is fatal.
void Start(Context *context, const Options &options);

// Present the frame that was just rendered.
void EndFrame(Context *context, const Options &options);

// Destroy the window and shut down GLFW.
void Finish(Context *context);

// Run a scene until the window is closed. Return the number of frames
// presented.
template <typename Scene>
long Run(const Options &options) {
	Context context;
	Start(&context, options);
	{
		Scene scene;
		scene.Init();
		while (!glfwWindowShouldClose(context.window)) {
			glfwPollEvents();
			scene.Render(context);
			EndFrame(&context, options);
		}
		scene.Destroy();
	}
	const long frames = context.frame;
	Finish(&context);
	return frames;
}

} // namespace app
} // namespace spin
