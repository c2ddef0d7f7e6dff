#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <source_location>
#include <string>

namespace ChainMeta {

// =============================================================================
// Error kinds surfaced by decode, encode, validation and conversion
// =============================================================================

enum class MetadataErrorKind {
    BadMagic,               // first four bytes are not the metadata marker
    UnsupportedVersion,     // tag is deprecated, unknown or compiled out
    MalformedPayload,       // payload does not match the schema of its version
    DanglingTypeReference,  // a TypeId that the registry does not contain
    UnsupportedDowngrade,   // conversion towards an older version
    UnsupportedConversion   // conversion with no defined path (legacy to modern)
};

const char* error_kind_name(MetadataErrorKind kind);

/// Error information with the context that was known when it was raised
struct MetadataError {
    MetadataErrorKind kind;
    std::string message;

    std::optional<uint8_t> version;   // schema version being processed
    std::optional<size_t> offset;     // byte offset of a decode failure
    std::string field_path;           // dotted path of the field being decoded or checked
    std::optional<uint32_t> type_id;  // offending id for DanglingTypeReference
    std::source_location location;

    MetadataError(MetadataErrorKind k, std::string msg,
                  std::source_location loc = std::source_location::current())
        : kind(k), message(std::move(msg)), location(loc) {}

    /// Human readable one-line description, including any recorded context.
    std::string to_string() const;

    // ---- Factories ----
    static MetadataError bad_magic(uint32_t found,
                                   std::source_location loc = std::source_location::current());
    static MetadataError unsupported_version(uint8_t tag,
                                             std::source_location loc = std::source_location::current());
    static MetadataError malformed(std::string msg,
                                   std::source_location loc = std::source_location::current());
    static MetadataError dangling(uint32_t id, std::string where,
                                  std::source_location loc = std::source_location::current());
    static MetadataError unsupported_downgrade(uint8_t from, uint8_t to,
                                               std::source_location loc = std::source_location::current());
    static MetadataError unsupported_conversion(uint8_t from, uint8_t to, std::string reason,
                                                std::source_location loc = std::source_location::current());

    MetadataError& with_version(uint8_t v) {
        version = v;
        return *this;
    }
};

} // namespace ChainMeta
