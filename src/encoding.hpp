// This file is part of reiter and is distributed under the MIT license, see LICENSE.md
#pragma once

#include <stddef.h>

// Returns the length of the UTF-8 sequence starting at data[offset], or 0 if the bytes at offset
// do not form a complete well-formed sequence (continuation byte, overlong form, surrogate, truncated tail)
size_t getUTF8SequenceLength(const char* data, size_t size, size_t offset);

// Number of bytes to step over to get past the character at offset; never 0
size_t getCodepointWidth(const char* data, size_t size, size_t offset);
