// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include "text_buffer.hpp"

#include <cstddef>

namespace spin {
namespace log {

class Record;

// Local buffer size for constructing log messages.
constexpr std::size_t LogBufferSize = 256;

// Write a record as a single line.
void WriteLine(TextBuffer &buffer, const Record &record, bool useColor);

// Writes records to stderr, formatting each one in a stack buffer.
class Writer {
public:
	// Check whether stderr supports color. Return true if logging is available.
	static bool Init();

	Writer() : mBuffer{mStorage} {}

	void Log(const Record &record);

	// Write the record with a fatal error banner and exit.
	[[noreturn]]
	void Fail(const Record &record);

private:
	char mStorage[LogBufferSize];
	TextBuffer mBuffer;
};

} // namespace log
} // namespace spin
