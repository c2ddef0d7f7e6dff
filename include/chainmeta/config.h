#ifndef CHAINMETA_CONFIG_H
#define CHAINMETA_CONFIG_H

#include <cstdint>

/**
 * @file config.h
 * @brief Build-time configuration for the ChainMeta library
 *
 * Each historical schema version can be compiled out by defining the matching
 * CHAINMETA_ENABLE_Vn macro to 0 (CMake options of the same name do this).
 * A disabled version is absent from RuntimeMetadata and its tag decodes as
 * UnsupportedVersion. The current version (V16) is always compiled.
 */

#ifndef CHAINMETA_ENABLE_V8
    #define CHAINMETA_ENABLE_V8 1
#endif
#ifndef CHAINMETA_ENABLE_V9
    #define CHAINMETA_ENABLE_V9 1
#endif
#ifndef CHAINMETA_ENABLE_V10
    #define CHAINMETA_ENABLE_V10 1
#endif
#ifndef CHAINMETA_ENABLE_V11
    #define CHAINMETA_ENABLE_V11 1
#endif
#ifndef CHAINMETA_ENABLE_V12
    #define CHAINMETA_ENABLE_V12 1
#endif
#ifndef CHAINMETA_ENABLE_V13
    #define CHAINMETA_ENABLE_V13 1
#endif
#ifndef CHAINMETA_ENABLE_V14
    #define CHAINMETA_ENABLE_V14 1
#endif
#ifndef CHAINMETA_ENABLE_V15
    #define CHAINMETA_ENABLE_V15 1
#endif

namespace ChainMeta {

/// Four-byte marker at the start of every envelope, ASCII "meta" read as a little-endian u32.
inline constexpr uint32_t kMetadataMagic = 0x6174656d;

/// Oldest tag the envelope still recognises. Tags below it are deprecated.
inline constexpr uint8_t kFirstSupportedVersion = 8;

/// Tag of the current schema version.
inline constexpr uint8_t kCurrentVersion = 16;

/// First version whose trees are backed by a type registry.
inline constexpr uint8_t kFirstModernVersion = 14;

} // namespace ChainMeta

#endif // CHAINMETA_CONFIG_H
