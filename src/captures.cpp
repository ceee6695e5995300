// This file is part of reiter and is distributed under the MIT license, see LICENSE.md
#include "common.hpp"
#include "captures.hpp"

Captures::Captures(): data(""), size(0)
{
}

Captures::Captures(const char* data, size_t size, const MatchRegion& region): data(data ? data : ""), size(size), region(region)
{
}

MatchPosition Captures::position(size_t index) const
{
	MatchPosition result = region.position(index);
	assert(!result || result.end <= size);

	return result;
}

StringSlice Captures::text(size_t index) const
{
	MatchPosition p = position(index);

	return p ? StringSlice(data + p.start, p.size()) : StringSlice();
}

size_t Captures::count() const
{
	return region.count();
}

bool Captures::empty() const
{
	return count() == 0;
}

GroupCursor Captures::groups() const
{
	return GroupCursor(this);
}

GroupPositionCursor Captures::groupPositions() const
{
	return GroupPositionCursor(this);
}

GroupCursor::GroupCursor(const Captures* captures): captures(captures), index(0)
{
}

bool GroupCursor::next(StringSlice& result)
{
	if (index >= captures->count())
		return false;

	result = captures->text(index++);
	return true;
}

GroupPositionCursor::GroupPositionCursor(const Captures* captures): captures(captures), index(0)
{
}

bool GroupPositionCursor::next(MatchPosition& result)
{
	if (index >= captures->count())
		return false;

	result = captures->position(index++);
	return true;
}

bool captures(Regex* re, const char* data, size_t size, Captures& result)
{
	MatchRegion region;

	if (!re->search(data, size, 0, size, MO_NONE, &region))
		return false;

	result = Captures(data, size, region);
	return true;
}
