// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include <string_view>
#include <vector>

namespace spin {

// Read a file, relative to the project directory, into memory. Errors are
// logged. Return false on failure.
bool ReadFile(std::vector<unsigned char> *data, std::string_view fileName);

} // namespace spin
