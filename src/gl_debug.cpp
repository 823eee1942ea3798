// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "gl_debug.hpp"

#include "gl.hpp" // IWYU pragma: keep
#include "log.hpp"

#if GL_KHR_debug && !__APPLE__

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

#include <string_view>

namespace spin {
namespace gl_debug {

namespace {

log::Level SeverityLevel(GLenum severity) {
	switch (severity) {
	case GL_DEBUG_SEVERITY_NOTIFICATION:
		return log::Level::Debug;
	case GL_DEBUG_SEVERITY_LOW:
		return log::Level::Info;
	case GL_DEBUG_SEVERITY_MEDIUM:
		return log::Level::Warn;
	default:
		return log::Level::Error;
	}
}

std::string_view TypeName(GLenum type) {
	switch (type) {
	case GL_DEBUG_TYPE_ERROR:
		return "error";
	case GL_DEBUG_TYPE_DEPRECATED_BEHAVIOR:
		return "deprecated";
	case GL_DEBUG_TYPE_UNDEFINED_BEHAVIOR:
		return "undefined";
	case GL_DEBUG_TYPE_PERFORMANCE:
		return "performance";
	case GL_DEBUG_TYPE_PORTABILITY:
		return "portability";
	default:
		return "other";
	}
}

void APIENTRY DebugCallback(GLenum, GLenum type, GLuint id, GLenum severity,
                            GLsizei length, const GLchar *message,
                            const void *) {
	std::string_view text = length >= 0 ? std::string_view(message, length)
	                                    : std::string_view{message};
	log::Record{SeverityLevel(severity), log::Location::Zero, "OpenGL",
	            log::Attr{"type", TypeName(type)}, log::Attr{"id", id},
	            log::Attr{"message", text}}
		.Log();
}

} // namespace

void Init() {
	if (!glfwExtensionSupported("GL_KHR_debug")) {
		LOG(Warn, "Debug context requested, but KHR_debug is missing.");
		return;
	}
	glEnable(GL_DEBUG_OUTPUT);
	glEnable(GL_DEBUG_OUTPUT_SYNCHRONOUS);
	glDebugMessageCallback(DebugCallback, nullptr);
	glDebugMessageControl(GL_DONT_CARE, GL_DONT_CARE, GL_DONT_CARE, 0, nullptr,
	                      GL_TRUE);
	LOG(Info, "OpenGL debug output enabled.");
}

} // namespace gl_debug
} // namespace spin

#else

namespace spin {
namespace gl_debug {

void Init() {
	LOG(Warn, "Debug context requested, but KHR_debug is missing.");
}

} // namespace gl_debug
} // namespace spin

#endif
