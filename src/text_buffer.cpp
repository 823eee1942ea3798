// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "text_buffer.hpp"

#include <cstdlib>
#include <cstring>

namespace spin {

namespace {

const char HexDigit[] = "0123456789abcdef";

// Return the character used in a two-character escape, or 0 if the character
// has no short escape.
char ShortEscape(unsigned char ch) {
	switch (ch) {
	case '\t':
		return 't';
	case '\n':
		return 'n';
	case '\r':
		return 'r';
	case '"':
		return '"';
	case '\\':
		return '\\';
	default:
		return 0;
	}
}

} // namespace

TextBuffer::~TextBuffer() {
	if (mOwned) {
		std::free(mStart);
	}
}

void TextBuffer::Append(std::string_view str) {
	Reserve(str.size());
	if (!str.empty()) {
		std::memcpy(mPos, str.data(), str.size());
		mPos += str.size();
	}
}

void TextBuffer::AppendQuoted(std::string_view str) {
	AppendChar('"');
	AppendEscaped(str);
	AppendChar('"');
}

void TextBuffer::AppendEscaped(std::string_view str) {
	// Longest escape is \xNN.
	constexpr std::size_t MaxEscapeSize = 4;
	for (const char c : str) {
		if (Avail() < MaxEscapeSize) {
			Reserve(MaxEscapeSize);
		}
		const unsigned char ch = static_cast<unsigned char>(c);
		if (const char escape = ShortEscape(ch); escape != 0) {
			mPos[0] = '\\';
			mPos[1] = escape;
			mPos += 2;
		} else if (ch < 0x20 || ch >= 0x7f) {
			mPos[0] = '\\';
			mPos[1] = 'x';
			mPos[2] = HexDigit[ch >> 4];
			mPos[3] = HexDigit[ch & 15];
			mPos += 4;
		} else {
			*mPos++ = c;
		}
	}
}

void TextBuffer::Reserve(std::size_t count) {
	const std::size_t size = Size();
	const std::size_t capacity = mEnd - mStart;
	if (capacity - size >= count) {
		return;
	}
	// Grow by half again, like Git's alloc_nr.
	std::size_t newCapacity = (capacity + 16) * 3 / 2;
	if (newCapacity < size + count) {
		newCapacity = size + count;
	}
	char *ptr;
	if (mOwned) {
		ptr = static_cast<char *>(std::realloc(mStart, newCapacity));
	} else {
		ptr = static_cast<char *>(std::malloc(newCapacity));
		if (ptr != nullptr && size > 0) {
			std::memcpy(ptr, mStart, size);
		}
	}
	if (ptr == nullptr) {
		// The log itself needs this buffer, so there is nowhere to report it.
		std::abort();
	}
	mStart = ptr;
	mPos = ptr + size;
	mEnd = ptr + newCapacity;
	mOwned = true;
}

} // namespace spin
