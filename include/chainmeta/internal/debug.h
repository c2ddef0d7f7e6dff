#pragma once

#include <cstdio>

/**
 * @file debug.h
 * @brief Conditional trace macros for the codec internals
 *
 * CMETA_DEBUG and CMETA_VERBOSE compile to nothing unless CHAINMETA_DEBUG or
 * CHAINMETA_VERBOSE is defined. Anything a caller should see goes through
 * logger.h instead.
 */

#ifdef CHAINMETA_DEBUG
    #define CMETA_DEBUG_ENABLED 1
#else
    #define CMETA_DEBUG_ENABLED 0
#endif

/**
 * @brief Main debug macro - outputs to stderr with [CMETA] prefix
 *
 * Usage: CMETA_DEBUG("decoding %zu registry entries", count);
 */
#if CMETA_DEBUG_ENABLED
    #define CMETA_DEBUG(fmt, ...) \
        fprintf(stderr, "[CMETA] " fmt "\n", ##__VA_ARGS__)
#else
    #define CMETA_DEBUG(fmt, ...) ((void)0)
#endif

/**
 * @brief Per-field tracing, only enabled with CHAINMETA_VERBOSE.
 */
#ifdef CHAINMETA_VERBOSE
    #define CMETA_VERBOSE(fmt, ...) \
        fprintf(stderr, "[CMETA:VERBOSE] " fmt "\n", ##__VA_ARGS__)
#else
    #define CMETA_VERBOSE(fmt, ...) ((void)0)
#endif
