// This file is part of reiter and is distributed under the MIT license, see LICENSE.md
#pragma once

#include <string>
#include <mutex>

class Output
{
public:
	virtual ~Output() {}

	virtual void error(const char* message, ...) = 0;
};

class StandardOutput: public Output
{
public:
	virtual void error(const char* message, ...);
};

class StringOutput: public Output
{
public:
	StringOutput(std::string& buf);

	virtual void error(const char* message, ...);

private:
	std::string& result;
	std::mutex mutex;
};

// Installs the sink used by error() and fatal(); nullptr restores the standard one
Output* setErrorOutput(Output* output);
