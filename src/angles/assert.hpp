#pragma once

#include <cassert>

#define ANGLES_ASSERT(condition)                                                                   \
    do                                                                                             \
    {                                                                                              \
        if (!(condition)) [[unlikely]]                                                             \
        {                                                                                          \
            assert(condition);                                                                     \
        }                                                                                          \
    } while (false)
