// This file is part of reiter and is distributed under the MIT license, see LICENSE.md
#include "common.hpp"
#include "output.hpp"

#include "stringutil.hpp"

#include <atomic>

#include <stdio.h>
#include <stdlib.h>
#include <stdarg.h>

void StandardOutput::error(const char* message, ...)
{
	va_list l;
	va_start(l, message);
	vfprintf(stderr, message, l);
	va_end(l);
}

StringOutput::StringOutput(std::string& buf): result(buf)
{
}

void StringOutput::error(const char* message, ...)
{
	std::unique_lock<std::mutex> lock(mutex);

	va_list l;
	va_start(l, message);
	strprintf(result, message, l);
	va_end(l);
}

static StandardOutput gStandardOutput;
static std::atomic<Output*> gErrorOutput(&gStandardOutput);

Output* setErrorOutput(Output* output)
{
	Output* previous = gErrorOutput.exchange(output ? output : &gStandardOutput);

	return previous == &gStandardOutput ? nullptr : previous;
}

static void reportError(const char* message, va_list args)
{
	std::string text;
	strprintf(text, message, args);

	gErrorOutput.load()->error("%s", text.c_str());
}

void error(const char* message, ...)
{
	va_list l;
	va_start(l, message);
	reportError(message, l);
	va_end(l);
}

void fatal(const char* message, ...)
{
	va_list l;
	va_start(l, message);
	reportError(message, l);
	va_end(l);
	exit(1);
}
