#pragma once

#include <cstdio>

#ifndef CELLPAINT_ENABLE_LOGGING
#define CELLPAINT_ENABLE_LOGGING 0
#endif

#if CELLPAINT_ENABLE_LOGGING
#define CELLPAINT_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[cellpaint] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define CELLPAINT_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[cellpaint] warning: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define CELLPAINT_LOG_DEBUG(...) do { } while (0)
#define CELLPAINT_LOG_WARN(...) do { } while (0)
#endif
