// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "log_internal.hpp"

#include "app.hpp"
#include "log.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <unistd.h>

namespace spin {
namespace log {

namespace {

// Return true if the output should be colorized using terminal escape
// sequences.
bool ShouldEnableColor() {
	// If $NO_COLOR is non-empty, no color.
	const char *noColor = std::getenv("NO_COLOR");
	if (noColor != nullptr && *noColor != '\0') {
		return false;
	}

	// If stderr is not a tty, no color.
	if (isatty(STDERR_FILENO) == 0) {
		return false;
	}

	const char *term = std::getenv("TERM");
	if (term == nullptr) {
		return false;
	}
	// TERM=dumb used by Xcode.
	if (std::strcmp(term, "dumb") == 0) {
		return false;
	}
	return true;
}

bool IsColorEnabled;

// Write the whole buffer to stderr.
void WriteStderr(const char *ptr, std::size_t size) {
	while (size > 0) {
		ssize_t amt = ::write(STDERR_FILENO, ptr, size);
		if (amt <= 0) {
			// Nowhere left to report this, throw it into the void.
			return;
		}
		ptr += amt;
		size -= amt;
	}
}

} // namespace

bool Writer::Init() {
	IsColorEnabled = ShouldEnableColor();
	return true;
}

void Writer::Log(const Record &record) {
	mBuffer.Clear();
	WriteLine(mBuffer, record, IsColorEnabled);
	WriteStderr(mBuffer.Start(), mBuffer.Size());
}

[[noreturn]]
void Writer::Fail(const Record &record) {
	mBuffer.Clear();
	WriteLine(mBuffer, record, IsColorEnabled);
	if (IsColorEnabled) {
		mBuffer.Append("\x1b[31m");
	}
	mBuffer.Append("===== Fatal Error =====");
	if (IsColorEnabled) {
		mBuffer.Append("\x1b[0m");
	}
	mBuffer.AppendChar('\n');
	WriteStderr(mBuffer.Start(), mBuffer.Size());
	app::ExitError();
}

} // namespace log
} // namespace spin
