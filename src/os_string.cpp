// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "os_string.hpp"

#include "log.hpp"

namespace spin {

void AppendPath(std::string *path, std::string_view view) {
	if (path->empty()) {
		FAIL("Path is empty.");
	}
	if (view.empty() || view[0] == Separator) {
		FAIL("Path is not relative.", log::Attr{"path", view});
	}
	if ((*path)[path->size() - 1] != Separator) {
		path->push_back(Separator);
	}
	path->append(view);
}

} // namespace spin
