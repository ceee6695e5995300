// This file is part of reiter and is distributed under the MIT license, see LICENSE.md
#pragma once

#include "regex.hpp"
#include "region.hpp"
#include "captures.hpp"

// Successive non-overlapping matches of re in [data, data + size), left to right.
// A zero-length match directly following a non-empty one is not reported; after a zero-length match
// the search resumes one character further.
// Cursors keep pointers to the regex and the text, both of which have to outlive the cursor.
class MatchCursor
{
public:
	MatchCursor(Regex* re, const char* data, size_t size);

	bool next(MatchPosition& result);

	const char* getData() const { return data; }
	size_t getSize() const { return size; }

private:
	enum State
	{
		State_Searching,
		State_Exhausted,
	};

	Regex* re;
	const char* data;
	size_t size;

	State state;
	size_t position;
	bool skipNextEmpty;

	MatchRegion region;
};

// Same sequence as MatchCursor, with all groups of every match
class CaptureCursor
{
public:
	CaptureCursor(Regex* re, const char* data, size_t size);

	bool next(Captures& result);

private:
	enum State
	{
		State_Searching,
		State_Exhausted,
	};

	Regex* re;
	const char* data;
	size_t size;

	State state;
	size_t position;
	bool skipNextEmpty;
};

// Pieces of text between matches, including the remainder after the last match
class SplitCursor
{
public:
	SplitCursor(Regex* re, const char* data, size_t size);

	bool next(StringSlice& result);

	// Text after the end of the last match consumed so far
	StringSlice getRemainder() const;

private:
	MatchCursor finder;
	size_t last;
};

// At most limit pieces; the last one holds everything that was not split
class BoundedSplitCursor
{
public:
	BoundedSplitCursor(Regex* re, const char* data, size_t size, size_t limit);

	bool next(StringSlice& result);

private:
	SplitCursor splits;
	size_t remaining;
};

MatchCursor findIter(Regex* re, const char* data, size_t size);
CaptureCursor capturesIter(Regex* re, const char* data, size_t size);
SplitCursor split(Regex* re, const char* data, size_t size);
BoundedSplitCursor splitn(Regex* re, const char* data, size_t size, size_t limit);
