// This file is part of reiter and is distributed under the MIT license, see LICENSE.md
#include "common.hpp"
#include "regex.hpp"

#include "region.hpp"

#include "re2/re2.h"

#include <memory>
#include <stdexcept>
#include <vector>

class RE2Regex: public Regex
{
public:
	RE2Regex(const char* string, unsigned int options)
	{
		RE2::Options opts;
		opts.set_posix_syntax((options & RO_POSIX) != 0);
		opts.set_perl_classes(true);
		opts.set_word_boundary(true);
		opts.set_dot_nl((options & RO_DOTALL) != 0);
		opts.set_literal((options & RO_LITERAL) != 0);
		opts.set_case_sensitive((options & RO_IGNORECASE) == 0);
		opts.set_log_errors(false);

		re.reset(new RE2(string, opts));
		if (!re->ok())
			throw std::runtime_error("Error parsing regular expression " + (string + (": " + re->error())));
	}

	virtual size_t getGroupCount() const
	{
		return re->NumberOfCapturingGroups();
	}

	virtual bool search(const char* data, size_t size, size_t from, size_t to, unsigned int options, MatchRegion* region)
	{
		if (from > to || to > size)
		{
			error("Invalid search range %zu..%zu for text of size %zu\n", from, to, size);
			return false;
		}

		// a null text can't tell empty groups from absent ones
		if (!data)
		{
			assert(size == 0);
			data = "";
		}

		size_t count = region ? 1 + getGroupCount() : 0;
		std::vector<re2::StringPiece> groups(count);

		re2::StringPiece text(data, size);

		if (!re->Match(text, from, to, getAnchor(options), groups.empty() ? nullptr : &groups[0], static_cast<int>(count)))
			return false;

		if (region)
		{
			region->resize(count);

			for (size_t i = 0; i < count; ++i)
				if (groups[i].data())
				{
					size_t start = groups[i].data() - data;
					region->set(i, start, start + groups[i].size());
				}
		}

		return true;
	}

private:
	std::unique_ptr<RE2> re;

	static RE2::Anchor getAnchor(unsigned int options)
	{
		if (options & MO_ANCHOR_BOTH)
			return RE2::ANCHOR_BOTH;

		if (options & MO_ANCHOR_START)
			return RE2::ANCHOR_START;

		return RE2::UNANCHORED;
	}
};

StringSlice::StringSlice(): data(0), size(0)
{
}

StringSlice::StringSlice(const char* data, size_t size): data(data), size(size)
{
}

std::string StringSlice::str() const
{
	return data ? std::string(data, size) : std::string();
}

StringSlice::operator bool() const
{
	return data != 0;
}

StringSlice Regex::search(const char* data, size_t size)
{
	MatchRegion region;

	if (!search(data, size, 0, size, MO_NONE, &region))
		return StringSlice();

	MatchPosition match = region.position(0);
	if (!match)
		return StringSlice();

	return StringSlice((data ? data : "") + match.start, match.size());
}

Regex* createRegex(const char* pattern, unsigned int options)
{
	return new RE2Regex(pattern, options);
}
