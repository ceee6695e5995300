// This file is part of reiter and is distributed under the MIT license, see LICENSE.md
#include "common.hpp"
#include "encoding.hpp"

#include <stdint.h>

inline bool isContinuation(uint8_t ch)
{
	return (ch & 0xC0) == 0x80;
}

size_t getUTF8SequenceLength(const char* data, size_t size, size_t offset)
{
	if (offset >= size)
		return 0;

	const uint8_t* s = reinterpret_cast<const uint8_t*>(data) + offset;
	size_t available = size - offset;

	uint8_t lead = s[0];

	// U+0000..U+007F
	if (lead < 0x80)
		return 1;

	// U+0080..U+07FF; C0 and C1 can only start overlong forms
	if (lead >= 0xC2 && lead < 0xE0)
		return (available >= 2 && isContinuation(s[1])) ? 2 : 0;

	// U+0800..U+FFFF
	if (lead >= 0xE0 && lead < 0xF0)
	{
		if (available < 3 || !isContinuation(s[1]) || !isContinuation(s[2]))
			return 0;

		uint32_t ch = ((lead & 0x0F) << 12) | ((s[1] & 0x3F) << 6) | (s[2] & 0x3F);

		// overlong form or UTF-16 surrogate
		if (ch < 0x800 || (ch >= 0xD800 && ch < 0xE000))
			return 0;

		return 3;
	}

	// U+10000..U+10FFFF
	if (lead >= 0xF0 && lead < 0xF5)
	{
		if (available < 4 || !isContinuation(s[1]) || !isContinuation(s[2]) || !isContinuation(s[3]))
			return 0;

		uint32_t ch = ((lead & 0x07) << 18) | ((s[1] & 0x3F) << 12) | ((s[2] & 0x3F) << 6) | (s[3] & 0x3F);

		if (ch < 0x10000 || ch > 0x10FFFF)
			return 0;

		return 4;
	}

	return 0;
}

size_t getCodepointWidth(const char* data, size_t size, size_t offset)
{
	size_t length = getUTF8SequenceLength(data, size, offset);

	return length == 0 ? 1 : length;
}
