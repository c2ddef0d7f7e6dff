#ifndef CHAINMETA_METADATA_H
#define CHAINMETA_METADATA_H

#include <cstdint>
#include <span>
#include <variant>
#include <vector>

#include "chainmeta/config.h"
#include "chainmeta/legacy/versions.h"
#include "chainmeta/modern/v14.h"
#include "chainmeta/modern/v15.h"
#include "chainmeta/modern/v16.h"
#include "chainmeta/outcome.h"

namespace ChainMeta {

/**
 * @brief Closed set of schema versions compiled into this build.
 *
 * Each alternative exposes `kVersion`, which is also its wire tag. The
 * current version is always last and always present.
 */
using RuntimeMetadata = std::variant<
#if CHAINMETA_ENABLE_V8
    v8::RuntimeMetadataV8,
#endif
#if CHAINMETA_ENABLE_V9
    v9::RuntimeMetadataV9,
#endif
#if CHAINMETA_ENABLE_V10
    v10::RuntimeMetadataV10,
#endif
#if CHAINMETA_ENABLE_V11
    v11::RuntimeMetadataV11,
#endif
#if CHAINMETA_ENABLE_V12
    v12::RuntimeMetadataV12,
#endif
#if CHAINMETA_ENABLE_V13
    v13::RuntimeMetadataV13,
#endif
#if CHAINMETA_ENABLE_V14
    v14::RuntimeMetadataV14,
#endif
#if CHAINMETA_ENABLE_V15
    v15::RuntimeMetadataV15,
#endif
    v16::RuntimeMetadataV16>;

/// Version tag of whichever schema metadata holds.
uint8_t version_of(const RuntimeMetadata& metadata);

/// True for versions whose trees reference a TypeRegistry.
constexpr bool is_modern_version(uint8_t version) {
    return version >= kFirstModernVersion;
}

/**
 * @brief The top-level decodable value: magic marker plus one schema tree.
 *
 * Wire form: u32 magic (little-endian `meta`), u8 version tag, payload.
 */
struct RuntimeMetadataPrefixed {
    uint32_t magic = kMetadataMagic;
    RuntimeMetadata metadata;

    RuntimeMetadataPrefixed() : metadata(v16::RuntimeMetadataV16{}) {}
    explicit RuntimeMetadataPrefixed(RuntimeMetadata m) : metadata(std::move(m)) {}

    uint8_t version() const { return version_of(metadata); }

    /// Registry of a modern tree, nullptr for string-typed versions.
    const TypeRegistry* types() const;

    bool operator==(const RuntimeMetadataPrefixed&) const = default;
};

/// Tags this build can decode, ascending.
std::vector<uint8_t> supported_versions();
bool is_supported_version(uint8_t tag);

/**
 * @brief Encodes the envelope.
 *
 * Modern trees must pass the closed-world check first (DanglingTypeReference).
 * Values that cannot be represented in their version, such as a hasher the
 * version does not know, fail with MalformedPayload.
 */
Outcome<std::vector<uint8_t>> encode(const RuntimeMetadataPrefixed& prefixed);

/**
 * @brief Decodes a complete envelope, all or nothing.
 *
 * Errors: BadMagic, UnsupportedVersion(tag), MalformedPayload (with version,
 * offset and field path, including trailing bytes), DanglingTypeReference.
 */
Outcome<RuntimeMetadataPrefixed> decode(std::span<const uint8_t> bytes);

/// Reads the version tag from the five-byte header without decoding the payload.
Outcome<uint8_t> version_of(std::span<const uint8_t> bytes);

// =============================================================================
// Opaque form
// =============================================================================

/**
 * @brief Encoded envelope as handed out by a runtime: the envelope bytes
 * behind a compact length prefix.
 */
struct OpaqueMetadata {
    std::vector<uint8_t> bytes;

    bool operator==(const OpaqueMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const { writer.write_bytes(bytes); }
    static OpaqueMetadata scale_decode(scale::Reader& reader) { return OpaqueMetadata{reader.read_bytes()}; }
};

Outcome<OpaqueMetadata> to_opaque(const RuntimeMetadataPrefixed& prefixed);
Outcome<RuntimeMetadataPrefixed> from_opaque(const OpaqueMetadata& opaque);

/// Parses the length-prefixed opaque form and decodes the envelope inside it.
Outcome<RuntimeMetadataPrefixed> decode_opaque(std::span<const uint8_t> bytes);

} // namespace ChainMeta

#endif // CHAINMETA_METADATA_H
