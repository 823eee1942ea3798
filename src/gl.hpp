// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

// This file provides the OpenGL API. Include it instead of including OpenGL
// headers directly, and define GLFW_INCLUDE_NONE before including GLFW.

#if __APPLE__

// ============================================================================
// macOS
// ============================================================================

// On macOS, an OpenGL loader is not necessary. We can just get the definitions
// directly from the OpenGL framework.

// OpenGL is deprecated on macOS. We don't care. This silences the warnings.
#define GL_SILENCE_DEPRECATION 1

#include <OpenGL/gl3.h> // IWYU pragma: export

#ifndef APIENTRY
#define APIENTRY
#endif

#else

// ============================================================================
// Linux
// ============================================================================

// The GLVND libOpenGL library exports every core profile entry point, so the
// prototypes can be linked directly without a loader.

#define GL_GLEXT_PROTOTYPES 1

#include <GL/glcorearb.h> // IWYU pragma: export

#endif
