// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "app.hpp"

#include "gl_debug.hpp"
#include "gl_shader.hpp"
#include "log.hpp"
#include "var.hpp"

#include <cstdlib>
#include <string>
#include <thread>

#define FAIL_GLFW(...) FAIL(__VA_ARGS__, GLFWErrorInfo::Get())

namespace spin {
namespace app {

namespace {

// Information about GLFW errors to add to log messages.
class GLFWErrorInfo {
public:
	static GLFWErrorInfo Get() {
		const char *description;
		int error = glfwGetError(&description);
		if (error == GLFW_NO_ERROR) {
			return GLFWErrorInfo{};
		}
		return GLFWErrorInfo{error, description};
	}

	GLFWErrorInfo() : mError{0}, mDescription{} {}
	GLFWErrorInfo(int error, const char *description)
		: mError{error},
		  mDescription{description != nullptr ? description : ""} {}

	void AddToRecord(log::Record &record) const {
		record.Add("domain", "GLFW");
		if (mError != 0) {
			record.Add("error", mError);
			record.Add("description", mDescription);
		}
	}

private:
	int mError;
	std::string mDescription;
};

extern "C" void ErrorCallback(int error, const char *description) {
	log::Record{log::Level::Error, log::Location::Zero, "GLFW error.",
	            GLFWErrorInfo{error, description}}
		.Log();
}

// Get an OpenGL string, such as the renderer name.
std::string_view GetGLString(GLenum name) {
	const GLubyte *value = glGetString(name);
	if (value == nullptr) {
		return {};
	}
	return reinterpret_cast<const char *>(value);
}

Context *GetContext(GLFWwindow *window) {
	return static_cast<Context *>(glfwGetWindowUserPointer(window));
}

void FramebufferSizeCallback(GLFWwindow *window, int width, int height) {
	Context *context = GetContext(window);
	if (context == nullptr) {
		return;
	}
	context->width = width;
	context->height = height;
	glViewport(0, 0, width, height);
	LOG(Debug, "Framebuffer resized.", log::Attr{"width", width},
	    log::Attr{"height", height});
}

void CharCallback(GLFWwindow *window, unsigned int codepoint) {
	(void)window;
	LOG(Debug, "Character input.", log::Attr{"codepoint", codepoint});
}

} // namespace

[[noreturn]]
void ExitError() {
	glfwTerminate();
	std::exit(1);
}

bool IsCloseKey(int key, int action) {
	return action == GLFW_PRESS && (key == GLFW_KEY_ESCAPE || key == GLFW_KEY_Q);
}

void KeyCallback(GLFWwindow *window, int key, int scancode, int action,
                 int mods) {
	(void)scancode;
	(void)mods;
	if (IsCloseKey(key, action)) {
		LOG(Debug, "Close requested.", log::Attr{"key", key});
		glfwSetWindowShouldClose(window, GLFW_TRUE);
	}
}

void Start(Context *context, const Options &options) {
	glfwSetErrorCallback(ErrorCallback);
	if (!glfwInit()) {
		FAIL_GLFW("Could not initialize GLFW.");
	}

	// All of these are necessary.
	//
	// - On Apple devices, context will be version 2.1 if no hints are
	//   provided. FORWARD_COMPAT, PROFILE, and VERSION are all required to get
	//   a different result.
	//
	// - On Mesa, 3.0 is the maximum without FORWARD_COMPAT, and 3.1 is the
	//   maximum with FORWARD_COMPAT but without CORE_PROFILE.
	glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
	glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
	glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
	glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
	glfwWindowHint(GLFW_VISIBLE, options.visible ? GLFW_TRUE : GLFW_FALSE);
	if (var::DebugContext.get()) {
		glfwWindowHint(GLFW_OPENGL_DEBUG_CONTEXT, GLFW_TRUE);
	}

	// GLFW copies the title, so it must be null-terminated only for the call.
	const std::string title{options.title};
	GLFWwindow *window = glfwCreateWindow(options.width, options.height,
	                                      title.c_str(), nullptr, nullptr);
	if (window == nullptr) {
		FAIL_GLFW("Could not create window.", log::Attr{"title", title});
	}

	*context = Context{};
	context->window = window;
	glfwGetFramebufferSize(window, &context->width, &context->height);
	glfwSetWindowUserPointer(window, context);
	glfwSetFramebufferSizeCallback(window, FramebufferSizeCallback);
	glfwSetKeyCallback(window, KeyCallback);
	glfwSetCharCallback(window, CharCallback);

	glfwMakeContextCurrent(window);
	LOG(Info, "Created window.", log::Attr{"title", title},
	    log::Attr{"renderer", GetGLString(GL_RENDERER)},
	    log::Attr{"version", GetGLString(GL_VERSION)});
	if (var::DebugContext.get()) {
		gl_debug::Init();
	}
	glfwSwapInterval(1);

	gl_shader::Init();
}

void EndFrame(Context *context, const Options &options) {
	glfwSwapBuffers(context->window);
	context->frame++;
	const int frameLimit = var::FrameLimit.get();
	if (frameLimit > 0 && context->frame >= frameLimit) {
		LOG(Info, "Reached frame limit.", log::Attr{"frames", context->frame});
		glfwSetWindowShouldClose(context->window, GLFW_TRUE);
	}
	if (options.frameSleep.count() > 0) {
		std::this_thread::sleep_for(options.frameSleep);
	}
}

void Finish(Context *context) {
	gl_shader::Destroy();
	glfwDestroyWindow(context->window);
	context->window = nullptr;
	glfwTerminate();
	LOG(Debug, "Shut down.", log::Attr{"frames", context->frame});
}

} // namespace app
} // namespace spin
