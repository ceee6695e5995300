// This file is part of reiter and is distributed under the MIT license, see LICENSE.md
#pragma once

#include <assert.h>
#include <stddef.h>

void error(const char* message, ...);
void fatal(const char* message, ...);
