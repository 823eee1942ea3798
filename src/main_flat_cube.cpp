// Copyright 2025 The Spin Demos Authors
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "app.hpp"
#include "log.hpp"
#include "scene_flat_cube.hpp"
#include "var.hpp"

int main(int argc, char **argv) {
	spin::log::Init();
	spin::ParseCommandArguments(argc - 1, argv + 1);
	spin::app::Run<spin::scene::FlatCube>({.title = "Flat Cube"});
	return 0;
}
