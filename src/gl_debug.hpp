// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

namespace spin {
namespace gl_debug {

// Initialize OpenGL debugging. Messages from the driver are sent to the log.
// The context must be current.
void Init();

} // namespace gl_debug
} // namespace spin
