// This file is part of reiter and is distributed under the MIT license, see LICENSE.md
#pragma once

#include "regex.hpp"
#include "region.hpp"

class GroupCursor;
class GroupPositionCursor;

// Groups of a single match; group 0 is the whole match.
// Refers to the searched text without copying it, so the text has to outlive the object.
class Captures
{
public:
	Captures();
	Captures(const char* data, size_t size, const MatchRegion& region);

	MatchPosition position(size_t index) const;
	StringSlice text(size_t index) const;

	size_t count() const;
	bool empty() const;

	GroupCursor groups() const;
	GroupPositionCursor groupPositions() const;

private:
	const char* data;
	size_t size;

	MatchRegion region;
};

class GroupCursor
{
public:
	GroupCursor(const Captures* captures);

	// Fills result with the next group (absent if it did not participate); returns false after the last group
	bool next(StringSlice& result);

private:
	const Captures* captures;
	size_t index;
};

class GroupPositionCursor
{
public:
	GroupPositionCursor(const Captures* captures);

	bool next(MatchPosition& result);

private:
	const Captures* captures;
	size_t index;
};

// Leftmost-first match over the entire text
bool captures(Regex* re, const char* data, size_t size, Captures& result);
