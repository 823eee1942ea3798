// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include <charconv>
#include <cstddef>
#include <string_view>

namespace spin {

// Text buffer for formatting log lines. Starts out in caller-provided storage,
// which is usually on the stack, and moves to the heap if it runs out of room.
class TextBuffer {
public:
	TextBuffer() : mStart{nullptr}, mPos{nullptr}, mEnd{nullptr}, mOwned{false} {}

	template <std::size_t N>
	explicit TextBuffer(char (&storage)[N])
		: mStart{storage}, mPos{storage}, mEnd{storage + N}, mOwned{false} {}

	~TextBuffer();

	TextBuffer(const TextBuffer &) = delete;
	TextBuffer &operator=(const TextBuffer &) = delete;

	const char *Start() const { return mStart; }
	std::size_t Size() const { return mPos - mStart; }
	std::size_t Avail() const { return mEnd - mPos; }
	std::string_view Contents() const { return {mStart, Size()}; }

	// Discard the contents. Storage is kept.
	void Clear() { mPos = mStart; }

	void AppendChar(char c) {
		if (mPos == mEnd) {
			Reserve(1);
		}
		*mPos++ = c;
	}

	void Append(std::string_view str);

	// Append a string in double quotes, with escapes.
	void AppendQuoted(std::string_view str);

	// Append a string with quotes, backslashes, control characters, and
	// non-ASCII bytes escaped.
	void AppendEscaped(std::string_view str);

	// Append a number in decimal. Floating-point numbers use the shortest
	// representation that reads back as the same value.
	template <typename Number>
	void AppendNumber(Number value) {
		constexpr std::size_t MaxNumberSize = 32;
		Reserve(MaxNumberSize);
		std::to_chars_result result = std::to_chars(mPos, mEnd, value);
		mPos = result.ptr;
	}

	void AppendBool(bool value) { Append(value ? "true" : "false"); }

	// Make room to append at least the given number of characters.
	void Reserve(std::size_t count);

private:
	char *mStart;
	char *mPos;
	char *mEnd;
	bool mOwned; // True if the storage came from malloc.
};

} // namespace spin
