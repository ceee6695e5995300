// This file is part of reiter and is distributed under the MIT license, see LICENSE.md
#pragma once

#include <vector>

#include <stddef.h>

// Byte range [start, end) of a match or a capture group; a default-constructed position is absent
struct MatchPosition
{
	size_t start;
	size_t end;
	bool present;

	MatchPosition();
	MatchPosition(size_t start, size_t end);

	size_t size() const;

	operator bool() const;
};

bool operator==(const MatchPosition& lhs, const MatchPosition& rhs);
bool operator!=(const MatchPosition& lhs, const MatchPosition& rhs);

// Scratch storage for the group positions of one engine search
class MatchRegion
{
public:
	MatchRegion();

	void clear();

	// Resets the region to count absent groups
	void resize(size_t count);

	void set(size_t index, size_t start, size_t end);

	MatchPosition position(size_t index) const;

	size_t count() const;

private:
	std::vector<MatchPosition> groups;
};
