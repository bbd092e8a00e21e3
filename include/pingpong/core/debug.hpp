#pragma once

#include <iostream>

// Set PINGPONG_ENABLE_DEBUG to 1 (CMake option) to enable debug output
#ifndef PINGPONG_ENABLE_DEBUG
#define PINGPONG_ENABLE_DEBUG 0
#endif

// Debug levels
#define DEBUG_LEVEL_NONE 0
#define DEBUG_LEVEL_BASIC 1
#define DEBUG_LEVEL_VERBOSE 2

// Set current debug level
#ifndef PINGPONG_DEBUG_LEVEL
#define PINGPONG_DEBUG_LEVEL DEBUG_LEVEL_BASIC
#endif

// Debug macros
#define DEBUG_MSG(level, x) do { \
    if (PINGPONG_ENABLE_DEBUG && level <= PINGPONG_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)
