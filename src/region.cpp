// This file is part of reiter and is distributed under the MIT license, see LICENSE.md
#include "common.hpp"
#include "region.hpp"

MatchPosition::MatchPosition(): start(0), end(0), present(false)
{
}

MatchPosition::MatchPosition(size_t start, size_t end): start(start), end(end), present(true)
{
	assert(start <= end);
}

size_t MatchPosition::size() const
{
	return end - start;
}

MatchPosition::operator bool() const
{
	return present;
}

bool operator==(const MatchPosition& lhs, const MatchPosition& rhs)
{
	if (!lhs.present || !rhs.present)
		return lhs.present == rhs.present;

	return lhs.start == rhs.start && lhs.end == rhs.end;
}

bool operator!=(const MatchPosition& lhs, const MatchPosition& rhs)
{
	return !(lhs == rhs);
}

MatchRegion::MatchRegion()
{
}

void MatchRegion::clear()
{
	groups.clear();
}

void MatchRegion::resize(size_t count)
{
	groups.assign(count, MatchPosition());
}

void MatchRegion::set(size_t index, size_t start, size_t end)
{
	assert(index < groups.size());

	groups[index] = MatchPosition(start, end);
}

MatchPosition MatchRegion::position(size_t index) const
{
	return index < groups.size() ? groups[index] : MatchPosition();
}

size_t MatchRegion::count() const
{
	return groups.size();
}
