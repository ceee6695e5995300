// This file is part of reiter and is distributed under the MIT license, see LICENSE.md
#include "common.hpp"
#include "stringutil.hpp"

#include <stdio.h>

void strprintf(std::string& result, const char* format, va_list args)
{
	char buffer[256];

	// args is formatted twice when the message does not fit into the buffer
	va_list temp;
	va_copy(temp, args);
	int count = vsnprintf(buffer, sizeof(buffer), format, temp);
	va_end(temp);

	assert(count >= 0);

	if (static_cast<size_t>(count) < sizeof(buffer))
	{
		result.append(buffer, count);
		return;
	}

	size_t offset = result.size();
	result.resize(offset + count + 1);

	vsnprintf(&result[offset], count + 1, format, args);

	assert(result[offset + count] == 0);
	result.resize(offset + count);
}
