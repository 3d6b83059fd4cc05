#pragma once

#include <cassert>

#define GLINT_ASSERT(condition)                                                                    \
    do                                                                                             \
    {                                                                                              \
        if (!(condition)) [[unlikely]]                                                             \
        {                                                                                          \
            assert(condition);                                                                     \
        }                                                                                          \
    } while (false)
