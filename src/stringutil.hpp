// This file is part of reiter and is distributed under the MIT license, see LICENSE.md
#pragma once

#include <string>

#include <stdarg.h>

void strprintf(std::string& result, const char* format, va_list args);
