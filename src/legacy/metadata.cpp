#include "chainmeta/legacy/metadata.h"

#include "chainmeta/internal/debug.h"
#include "chainmeta/logger.h"

namespace ChainMeta::legacy {

using scale::decode_field;

const char* map_shape_name(MapShape shape) {
    switch (shape) {
        case MapShape::Map: return "Map";
        case MapShape::DoubleMap: return "DoubleMap";
        case MapShape::NMap: return "NMap";
    }
    return "?";
}

// =============================================================================
// Version independent records
// =============================================================================

void FunctionArgumentMetadata::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, name);
    scale::encode(writer, ty);
}

FunctionArgumentMetadata FunctionArgumentMetadata::scale_decode(scale::Reader& reader) {
    FunctionArgumentMetadata arg;
    arg.name = decode_field<std::string>(reader, "name");
    arg.ty = decode_field<std::string>(reader, "ty");
    return arg;
}

void FunctionMetadata::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, name);
    scale::encode(writer, arguments);
    scale::encode(writer, documentation);
}

FunctionMetadata FunctionMetadata::scale_decode(scale::Reader& reader) {
    FunctionMetadata function;
    function.name = decode_field<std::string>(reader, "name");
    function.arguments = decode_field<std::vector<FunctionArgumentMetadata>>(reader, "arguments");
    function.documentation = decode_field<std::vector<std::string>>(reader, "documentation");
    return function;
}

void EventMetadata::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, name);
    scale::encode(writer, arguments);
    scale::encode(writer, documentation);
}

EventMetadata EventMetadata::scale_decode(scale::Reader& reader) {
    EventMetadata event;
    event.name = decode_field<std::string>(reader, "name");
    event.arguments = decode_field<std::vector<std::string>>(reader, "arguments");
    event.documentation = decode_field<std::vector<std::string>>(reader, "documentation");
    return event;
}

void ModuleConstantMetadata::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, name);
    scale::encode(writer, ty);
    scale::encode(writer, value);
    scale::encode(writer, documentation);
}

ModuleConstantMetadata ModuleConstantMetadata::scale_decode(scale::Reader& reader) {
    ModuleConstantMetadata constant;
    constant.name = decode_field<std::string>(reader, "name");
    constant.ty = decode_field<std::string>(reader, "ty");
    constant.value = decode_field<std::vector<uint8_t>>(reader, "value");
    constant.documentation = decode_field<std::vector<std::string>>(reader, "documentation");
    return constant;
}

void ErrorMetadata::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, name);
    scale::encode(writer, documentation);
}

ErrorMetadata ErrorMetadata::scale_decode(scale::Reader& reader) {
    ErrorMetadata error;
    error.name = decode_field<std::string>(reader, "name");
    error.documentation = decode_field<std::vector<std::string>>(reader, "documentation");
    return error;
}

void ExtrinsicMetadata::scale_encode(scale::Writer& writer) const {
    writer.write_u8(version);
    scale::encode(writer, signed_extensions);
}

ExtrinsicMetadata ExtrinsicMetadata::scale_decode(scale::Reader& reader) {
    ExtrinsicMetadata extrinsic;
    extrinsic.version = decode_field<uint8_t>(reader, "version");
    extrinsic.signed_extensions = decode_field<std::vector<std::string>>(reader, "signed_extensions");
    return extrinsic;
}

// =============================================================================
// Storage entry type
//
//   0 Plain(value)
//   1 Map { hasher, key, value, is_linked }
//   2 DoubleMap { hasher, key1, key2, value, key2_hasher }
//   3 NMap { keys, hashers, value }                          V13 only
// =============================================================================

namespace {

void require_key_count(const MapStorage& map, size_t expected) {
    if (map.keys.size() != expected) {
        throw scale::EncodeError(detail::format("%s storage needs %zu keys, has %zu",
                                                map_shape_name(map.shape), expected, map.keys.size()));
    }
}

void encode_map(scale::Writer& writer, const MapStorage& map, uint8_t version) {
    switch (map.shape) {
        case MapShape::Map:
            require_key_count(map, 1);
            writer.write_u8(1);
            encode_hasher(writer, map.keys[0].hasher, version);
            scale::encode(writer, map.keys[0].key);
            scale::encode(writer, map.value);
            writer.write_bool(map.is_linked);
            return;
        case MapShape::DoubleMap:
            require_key_count(map, 2);
            if (map.is_linked) {
                throw scale::EncodeError("DoubleMap storage cannot be linked");
            }
            writer.write_u8(2);
            encode_hasher(writer, map.keys[0].hasher, version);
            scale::encode(writer, map.keys[0].key);
            scale::encode(writer, map.keys[1].key);
            scale::encode(writer, map.value);
            encode_hasher(writer, map.keys[1].hasher, version);
            return;
        case MapShape::NMap:
            if (version < 13) {
                throw scale::EncodeError(detail::format("NMap storage does not exist in metadata V%u",
                                                        static_cast<unsigned>(version)));
            }
            if (map.is_linked) {
                throw scale::EncodeError("NMap storage cannot be linked");
            }
            writer.write_u8(3);
            writer.write_length(map.keys.size());
            for (const auto& key : map.keys) {
                scale::encode(writer, key.key);
            }
            writer.write_length(map.keys.size());
            for (const auto& key : map.keys) {
                encode_hasher(writer, key.hasher, version);
            }
            scale::encode(writer, map.value);
            return;
    }
}

} // namespace

void encode_storage_entry_type(scale::Writer& writer, const StorageEntryType& ty, uint8_t version) {
    if (const auto* plain = std::get_if<PlainStorage>(&ty)) {
        writer.write_u8(0);
        scale::encode(writer, plain->value);
        return;
    }
    encode_map(writer, std::get<MapStorage>(ty), version);
}

StorageEntryType decode_storage_entry_type(scale::Reader& reader, uint8_t version) {
    const uint8_t max_tag = version >= 13 ? 3 : 2;
    switch (reader.read_tag("StorageEntryType", max_tag)) {
        case 0:
            return PlainStorage{decode_field<std::string>(reader, "Plain")};
        case 1: {
            scale::FieldScope scope(reader, "Map");
            MapStorage map;
            map.shape = MapShape::Map;
            StorageKey key;
            {
                scale::FieldScope field(reader, "hasher");
                key.hasher = decode_hasher(reader, version);
            }
            key.key = decode_field<std::string>(reader, "key");
            map.keys.push_back(std::move(key));
            map.value = decode_field<std::string>(reader, "value");
            map.is_linked = decode_field<bool>(reader, version >= 12 ? "unused" : "is_linked");
            return map;
        }
        case 2: {
            scale::FieldScope scope(reader, "DoubleMap");
            MapStorage map;
            map.shape = MapShape::DoubleMap;
            StorageKey first;
            StorageKey second;
            {
                scale::FieldScope field(reader, "hasher");
                first.hasher = decode_hasher(reader, version);
            }
            first.key = decode_field<std::string>(reader, "key1");
            second.key = decode_field<std::string>(reader, "key2");
            map.value = decode_field<std::string>(reader, "value");
            {
                scale::FieldScope field(reader, "key2_hasher");
                second.hasher = decode_hasher(reader, version);
            }
            map.keys.push_back(std::move(first));
            map.keys.push_back(std::move(second));
            return map;
        }
        default: {
            scale::FieldScope scope(reader, "NMap");
            MapStorage map;
            map.shape = MapShape::NMap;
            auto keys = decode_field<std::vector<std::string>>(reader, "keys");
            std::vector<StorageHasher> hashers;
            {
                scale::FieldScope field(reader, "hashers");
                size_t count = reader.read_length();
                hashers.reserve(count);
                for (size_t i = 0; i < count; ++i) {
                    hashers.push_back(decode_hasher(reader, version));
                }
            }
            if (keys.size() != hashers.size()) {
                reader.fail(detail::format("NMap has %zu keys but %zu hashers", keys.size(), hashers.size()));
            }
            for (size_t i = 0; i < keys.size(); ++i) {
                map.keys.push_back(StorageKey{hashers[i], std::move(keys[i])});
            }
            map.value = decode_field<std::string>(reader, "value");
            return map;
        }
    }
}

// =============================================================================
// Version dependent records
// =============================================================================

template<uint8_t V>
void StorageEntryMetadata<V>::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, name);
    scale::encode(writer, modifier);
    encode_storage_entry_type(writer, ty, V);
    scale::encode(writer, default_value);
    scale::encode(writer, documentation);
}

template<uint8_t V>
StorageEntryMetadata<V> StorageEntryMetadata<V>::scale_decode(scale::Reader& reader) {
    StorageEntryMetadata entry;
    entry.name = decode_field<std::string>(reader, "name");
    entry.modifier = decode_field<StorageEntryModifier>(reader, "modifier");
    {
        scale::FieldScope scope(reader, "ty");
        entry.ty = decode_storage_entry_type(reader, V);
    }
    entry.default_value = decode_field<std::vector<uint8_t>>(reader, "default");
    entry.documentation = decode_field<std::vector<std::string>>(reader, "documentation");
    return entry;
}

template<uint8_t V>
void StorageMetadata<V>::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, prefix);
    scale::encode(writer, entries);
}

template<uint8_t V>
StorageMetadata<V> StorageMetadata<V>::scale_decode(scale::Reader& reader) {
    StorageMetadata storage;
    storage.prefix = decode_field<std::string>(reader, "prefix");
    storage.entries = decode_field<std::vector<StorageEntryMetadata<V>>>(reader, "entries");
    return storage;
}

namespace {

// Fields common to every module layout, in wire order
template<typename M>
void encode_module_body(scale::Writer& writer, const M& module) {
    scale::encode(writer, module.name);
    scale::encode(writer, module.storage);
    scale::encode(writer, module.calls);
    scale::encode(writer, module.event);
    scale::encode(writer, module.constants);
    scale::encode(writer, module.errors);
}

template<typename M, uint8_t V>
void decode_module_body(scale::Reader& reader, M& module) {
    module.name = decode_field<std::string>(reader, "name");
    module.storage = decode_field<std::optional<StorageMetadata<V>>>(reader, "storage");
    module.calls = decode_field<std::optional<std::vector<FunctionMetadata>>>(reader, "calls");
    module.event = decode_field<std::optional<std::vector<EventMetadata>>>(reader, "event");
    module.constants = decode_field<std::vector<ModuleConstantMetadata>>(reader, "constants");
    module.errors = decode_field<std::vector<ErrorMetadata>>(reader, "errors");
}

} // namespace

template<uint8_t V>
void ModuleMetadata<V, false>::scale_encode(scale::Writer& writer) const {
    encode_module_body(writer, *this);
}

template<uint8_t V>
ModuleMetadata<V, false> ModuleMetadata<V, false>::scale_decode(scale::Reader& reader) {
    ModuleMetadata module;
    decode_module_body<ModuleMetadata, V>(reader, module);
    return module;
}

template<uint8_t V>
void ModuleMetadata<V, true>::scale_encode(scale::Writer& writer) const {
    encode_module_body(writer, *this);
    writer.write_u8(index);
}

template<uint8_t V>
ModuleMetadata<V, true> ModuleMetadata<V, true>::scale_decode(scale::Reader& reader) {
    ModuleMetadata module;
    decode_module_body<ModuleMetadata, V>(reader, module);
    module.index = decode_field<uint8_t>(reader, "index");
    return module;
}

template<uint8_t V>
void RuntimeMetadata<V, false>::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, modules);
}

template<uint8_t V>
RuntimeMetadata<V, false> RuntimeMetadata<V, false>::scale_decode(scale::Reader& reader) {
    RuntimeMetadata metadata;
    metadata.modules = decode_field<std::vector<ModuleMetadata<V>>>(reader, "modules");
    CMETA_DEBUG("decoded V%u with %zu modules", static_cast<unsigned>(V), metadata.modules.size());
    return metadata;
}

template<uint8_t V>
void RuntimeMetadata<V, true>::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, modules);
    scale::encode(writer, extrinsic);
}

template<uint8_t V>
RuntimeMetadata<V, true> RuntimeMetadata<V, true>::scale_decode(scale::Reader& reader) {
    RuntimeMetadata metadata;
    metadata.modules = decode_field<std::vector<ModuleMetadata<V>>>(reader, "modules");
    metadata.extrinsic = decode_field<ExtrinsicMetadata>(reader, "extrinsic");
    CMETA_DEBUG("decoded V%u with %zu modules", static_cast<unsigned>(V), metadata.modules.size());
    return metadata;
}

// Every supported string-typed version
#define CHAINMETA_INSTANTIATE_LEGACY(V) \
    template struct StorageEntryMetadata<V>; \
    template struct StorageMetadata<V>; \
    template struct ModuleMetadata<V>; \
    template struct RuntimeMetadata<V>;

CHAINMETA_INSTANTIATE_LEGACY(8)
CHAINMETA_INSTANTIATE_LEGACY(9)
CHAINMETA_INSTANTIATE_LEGACY(10)
CHAINMETA_INSTANTIATE_LEGACY(11)
CHAINMETA_INSTANTIATE_LEGACY(12)
CHAINMETA_INSTANTIATE_LEGACY(13)

#undef CHAINMETA_INSTANTIATE_LEGACY

} // namespace ChainMeta::legacy
