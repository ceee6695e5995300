// This file is part of reiter and is distributed under the MIT license, see LICENSE.md
#include "common.hpp"
#include "find.hpp"

#include "encoding.hpp"

static MatchPosition getWholeMatch(const MatchRegion& region, size_t from, size_t size)
{
	MatchPosition match = region.position(0);

	if (!match || match.start < from || match.end > size)
		fatal("Regex engine reported a match without a valid position (search from %zu in text of size %zu)\n", from, size);

	return match;
}

MatchCursor::MatchCursor(Regex* re, const char* data, size_t size)
	: re(re)
	, data(data ? data : "")
	, size(size)
	, state(State_Searching)
	, position(0)
	, skipNextEmpty(false)
{
}

bool MatchCursor::next(MatchPosition& result)
{
	while (state == State_Searching)
	{
		if (position > size)
			break;

		region.clear();

		if (!re->search(data, size, position, size, MO_NONE, &region))
			break;

		MatchPosition match = getWholeMatch(region, position, size);

		if (match.start == match.end)
		{
			position = match.end + getCodepointWidth(data, size, match.end);

			// an empty match right where the previous match ended
			if (skipNextEmpty)
			{
				skipNextEmpty = false;
				continue;
			}
		}
		else
		{
			position = match.end;
			skipNextEmpty = true;
		}

		result = match;
		return true;
	}

	state = State_Exhausted;
	return false;
}

CaptureCursor::CaptureCursor(Regex* re, const char* data, size_t size)
	: re(re)
	, data(data ? data : "")
	, size(size)
	, state(State_Searching)
	, position(0)
	, skipNextEmpty(false)
{
}

bool CaptureCursor::next(Captures& result)
{
	while (state == State_Searching)
	{
		if (position > size)
			break;

		MatchRegion region;

		if (!re->search(data, size, position, size, MO_NONE, &region))
			break;

		MatchPosition match = getWholeMatch(region, position, size);

		if (match.start == match.end)
		{
			position = match.end + getCodepointWidth(data, size, match.end);

			if (skipNextEmpty)
			{
				skipNextEmpty = false;
				continue;
			}
		}
		else
		{
			position = match.end;
			skipNextEmpty = true;
		}

		result = Captures(data, size, region);
		return true;
	}

	state = State_Exhausted;
	return false;
}

SplitCursor::SplitCursor(Regex* re, const char* data, size_t size): finder(re, data, size), last(0)
{
}

bool SplitCursor::next(StringSlice& result)
{
	const char* data = finder.getData();
	size_t size = finder.getSize();

	MatchPosition match;

	if (finder.next(match))
	{
		result = StringSlice(data + last, match.start - last);
		last = match.end;
		return true;
	}

	if (last >= size)
		return false;

	result = StringSlice(data + last, size - last);
	last = size;
	return true;
}

StringSlice SplitCursor::getRemainder() const
{
	return StringSlice(finder.getData() + last, finder.getSize() - last);
}

BoundedSplitCursor::BoundedSplitCursor(Regex* re, const char* data, size_t size, size_t limit): splits(re, data, size), remaining(limit)
{
}

bool BoundedSplitCursor::next(StringSlice& result)
{
	if (remaining == 0)
		return false;

	remaining--;

	if (remaining == 0)
	{
		result = splits.getRemainder();
		return true;
	}

	if (!splits.next(result))
	{
		remaining = 0;
		return false;
	}

	return true;
}

MatchCursor findIter(Regex* re, const char* data, size_t size)
{
	return MatchCursor(re, data, size);
}

CaptureCursor capturesIter(Regex* re, const char* data, size_t size)
{
	return CaptureCursor(re, data, size);
}

SplitCursor split(Regex* re, const char* data, size_t size)
{
	return SplitCursor(re, data, size);
}

BoundedSplitCursor splitn(Regex* re, const char* data, size_t size, size_t limit)
{
	return BoundedSplitCursor(re, data, size, limit);
}
