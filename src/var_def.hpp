// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0

// Variable definitions. Don't include this file directly. This must be included
// from a file that defines the following macros:
//
// DEFVAR(name, type, description)

DEFVAR(DebugContext, bool, "If true, create a debug OpenGL context.")
DEFVAR(ProjectPath, std::string,
       "Path to the project directory. If set, shaders are loaded from the "
       "shader directory instead of the copies embedded in the executable.")
DEFVAR(FrameLimit, int,
       "If nonzero, close the window after rendering this many frames.")
DEFVAR(LogLevel, std::string,
       "Minimum level of log messages to show: debug, info, warn, or error.")
