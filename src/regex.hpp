// This file is part of reiter and is distributed under the MIT license, see LICENSE.md
#pragma once

#include <string>

#include <stddef.h>

class MatchRegion;

enum RegexOptions
{
	RO_IGNORECASE = 1 << 0,
	RO_LITERAL = 1 << 1,
	RO_POSIX = 1 << 2,
	RO_DOTALL = 1 << 3,
};

enum MatchOptions
{
	MO_NONE = 0,
	MO_ANCHOR_START = 1 << 0,
	MO_ANCHOR_BOTH = 1 << 1,
};

// Non-owning view of a piece of the searched text; a default-constructed slice is absent
struct StringSlice
{
	const char* data;
	size_t size;

	StringSlice();
	StringSlice(const char* data, size_t size);

	std::string str() const;

	operator bool() const;
};

class Regex
{
public:
	virtual ~Regex() {}

	// Number of capturing groups, not counting the whole match
	virtual size_t getGroupCount() const = 0;

	// Leftmost-first search for a match inside [from, to] of data; text outside of the range is used as context.
	// On success region (if any) holds 1 + getGroupCount() entries, entry 0 being the whole match.
	virtual bool search(const char* data, size_t size, size_t from, size_t to, unsigned int options, MatchRegion* region) = 0;

	StringSlice search(const char* data, size_t size);
};

Regex* createRegex(const char* pattern, unsigned int options);
