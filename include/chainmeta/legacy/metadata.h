#ifndef CHAINMETA_LEGACY_METADATA_H
#define CHAINMETA_LEGACY_METADATA_H

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "chainmeta/scale/scale.h"
#include "chainmeta/storage.h"

/**
 * @file metadata.h
 * @brief Schema records shared by the string-typed versions V8 to V13
 *
 * Types in these versions are written inline as descriptive strings such as
 * `T::Balance` or `Vec<u8>`; nothing refers to a registry. Records whose wire
 * form changed between versions are templates on the version number, and each
 * version names its own instantiation in legacy/versions.h.
 */

namespace ChainMeta::legacy {

struct FunctionArgumentMetadata {
    std::string name;
    std::string ty;

    bool operator==(const FunctionArgumentMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static FunctionArgumentMetadata scale_decode(scale::Reader& reader);
};

struct FunctionMetadata {
    std::string name;
    std::vector<FunctionArgumentMetadata> arguments;
    std::vector<std::string> documentation;

    bool operator==(const FunctionMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static FunctionMetadata scale_decode(scale::Reader& reader);
};

struct EventMetadata {
    std::string name;
    std::vector<std::string> arguments;
    std::vector<std::string> documentation;

    bool operator==(const EventMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static EventMetadata scale_decode(scale::Reader& reader);
};

struct ModuleConstantMetadata {
    std::string name;
    std::string ty;
    std::vector<uint8_t> value;
    std::vector<std::string> documentation;

    bool operator==(const ModuleConstantMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static ModuleConstantMetadata scale_decode(scale::Reader& reader);
};

struct ErrorMetadata {
    std::string name;
    std::vector<std::string> documentation;

    bool operator==(const ErrorMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static ErrorMetadata scale_decode(scale::Reader& reader);
};

struct ExtrinsicMetadata {
    uint8_t version = 0;
    std::vector<std::string> signed_extensions;

    bool operator==(const ExtrinsicMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static ExtrinsicMetadata scale_decode(scale::Reader& reader);
};

// =============================================================================
// Storage
// =============================================================================

struct PlainStorage {
    std::string value;
    bool operator==(const PlainStorage&) const = default;
};

/// Wire variant a MapStorage was decoded from, kept so it re-encodes identically.
enum class MapShape : uint8_t {
    Map,        // one key, carries is_linked
    DoubleMap,  // two keys
    NMap        // any number of keys, V13 only
};

const char* map_shape_name(MapShape shape);

struct StorageKey {
    StorageHasher hasher = StorageHasher::Blake2_128;
    std::string key;
    bool operator==(const StorageKey&) const = default;
};

/**
 * @brief Keyed storage, unified across Map, DoubleMap and NMap.
 *
 * keys holds the (hasher, key type) pairs in wire order: the single key of a
 * Map, `key1` then `key2` for a DoubleMap, and the parallel key and hasher
 * lists zipped for an NMap. is_linked is only meaningful for MapShape::Map
 * (the flag was renamed `unused` in V12).
 */
struct MapStorage {
    MapShape shape = MapShape::Map;
    std::vector<StorageKey> keys;
    std::string value;
    bool is_linked = false;

    bool operator==(const MapStorage&) const = default;
};

using StorageEntryType = std::variant<PlainStorage, MapStorage>;

void encode_storage_entry_type(scale::Writer& writer, const StorageEntryType& ty, uint8_t version);
StorageEntryType decode_storage_entry_type(scale::Reader& reader, uint8_t version);

template<uint8_t V>
struct StorageEntryMetadata {
    std::string name;
    StorageEntryModifier modifier = StorageEntryModifier::Optional;
    StorageEntryType ty;
    std::vector<uint8_t> default_value;
    std::vector<std::string> documentation;

    bool operator==(const StorageEntryMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static StorageEntryMetadata scale_decode(scale::Reader& reader);
};

template<uint8_t V>
struct StorageMetadata {
    std::string prefix;
    std::vector<StorageEntryMetadata<V>> entries;

    bool operator==(const StorageMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static StorageMetadata scale_decode(scale::Reader& reader);
};

// =============================================================================
// Modules
// =============================================================================

/// Modules of V8 to V11 are identified by position; V12 adds an explicit index.
template<uint8_t V, bool Indexed = (V >= 12)>
struct ModuleMetadata;

template<uint8_t V>
struct ModuleMetadata<V, false> {
    std::string name;
    std::optional<StorageMetadata<V>> storage;
    std::optional<std::vector<FunctionMetadata>> calls;
    std::optional<std::vector<EventMetadata>> event;
    std::vector<ModuleConstantMetadata> constants;
    std::vector<ErrorMetadata> errors;

    bool operator==(const ModuleMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static ModuleMetadata scale_decode(scale::Reader& reader);
};

template<uint8_t V>
struct ModuleMetadata<V, true> {
    std::string name;
    std::optional<StorageMetadata<V>> storage;
    std::optional<std::vector<FunctionMetadata>> calls;
    std::optional<std::vector<EventMetadata>> event;
    std::vector<ModuleConstantMetadata> constants;
    std::vector<ErrorMetadata> errors;
    // Preserved as encoded, need not match the position in the module list
    uint8_t index = 0;

    bool operator==(const ModuleMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static ModuleMetadata scale_decode(scale::Reader& reader);
};

// =============================================================================
// Top level
// =============================================================================

/// V8 to V10 carry only modules; V11 adds the extrinsic descriptor.
template<uint8_t V, bool HasExtrinsic = (V >= 11)>
struct RuntimeMetadata;

template<uint8_t V>
struct RuntimeMetadata<V, false> {
    static constexpr uint8_t kVersion = V;

    std::vector<ModuleMetadata<V>> modules;

    bool operator==(const RuntimeMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static RuntimeMetadata scale_decode(scale::Reader& reader);
};

template<uint8_t V>
struct RuntimeMetadata<V, true> {
    static constexpr uint8_t kVersion = V;

    std::vector<ModuleMetadata<V>> modules;
    ExtrinsicMetadata extrinsic;

    bool operator==(const RuntimeMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static RuntimeMetadata scale_decode(scale::Reader& reader);
};

} // namespace ChainMeta::legacy

#endif // CHAINMETA_LEGACY_METADATA_H
