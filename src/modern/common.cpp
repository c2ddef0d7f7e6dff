#include "chainmeta/modern/common.h"

#include "chainmeta/logger.h"

namespace ChainMeta::modern {

using scale::decode_field;

void PalletConstantMetadata::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, name);
    scale::encode(writer, ty);
    scale::encode(writer, value);
    scale::encode(writer, docs);
}

PalletConstantMetadata PalletConstantMetadata::scale_decode(scale::Reader& reader) {
    PalletConstantMetadata constant;
    constant.name = decode_field<std::string>(reader, "name");
    constant.ty = decode_field<TypeId>(reader, "ty");
    constant.value = decode_field<std::vector<uint8_t>>(reader, "value");
    constant.docs = decode_field<std::vector<std::string>>(reader, "docs");
    return constant;
}

// =============================================================================
// Storage
// =============================================================================

void encode_storage_entry_type(scale::Writer& writer, const StorageEntryType& ty) {
    if (const auto* plain = std::get_if<PlainStorageType>(&ty)) {
        writer.write_u8(0);
        scale::encode(writer, plain->value);
        return;
    }
    const auto& map = std::get<MapStorageType>(ty);
    writer.write_u8(1);
    writer.write_length(map.hashers.size());
    for (StorageHasher hasher : map.hashers) {
        encode_hasher(writer, hasher, kCurrentVersion);
    }
    scale::encode(writer, map.key);
    scale::encode(writer, map.value);
}

StorageEntryType decode_storage_entry_type(scale::Reader& reader) {
    if (reader.read_tag("StorageEntryType", 1) == 0) {
        return PlainStorageType{decode_field<TypeId>(reader, "Plain")};
    }
    scale::FieldScope scope(reader, "Map");
    MapStorageType map;
    {
        scale::FieldScope field(reader, "hashers");
        size_t count = reader.read_length();
        map.hashers.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            map.hashers.push_back(decode_hasher(reader, kCurrentVersion));
        }
    }
    map.key = decode_field<TypeId>(reader, "key");
    map.value = decode_field<TypeId>(reader, "value");
    return map;
}

Outcome<std::vector<StorageKeyType>> MapStorageType::keys(const TypeRegistry& registry) const {
    std::vector<StorageKeyType> out;
    if (hashers.size() == 1) {
        out.push_back(StorageKeyType{hashers[0], key});
        return Ok(std::move(out));
    }
    auto resolved = registry.resolve(key);
    if (resolved.is_err()) {
        return std::move(resolved).error();
    }
    const auto* tuple = std::get_if<TypeDefTuple>(&resolved.value()->def);
    if (tuple == nullptr || tuple->elements.size() != hashers.size()) {
        return MetadataError::malformed(detail::format(
            "map with %zu hashers needs a key tuple of the same arity (key type %u)",
            hashers.size(), key.value));
    }
    for (size_t i = 0; i < hashers.size(); ++i) {
        out.push_back(StorageKeyType{hashers[i], tuple->elements[i]});
    }
    return Ok(std::move(out));
}

void StorageEntryMetadata::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, name);
    scale::encode(writer, modifier);
    encode_storage_entry_type(writer, ty);
    scale::encode(writer, default_value);
    scale::encode(writer, docs);
}

StorageEntryMetadata StorageEntryMetadata::scale_decode(scale::Reader& reader) {
    StorageEntryMetadata entry;
    entry.name = decode_field<std::string>(reader, "name");
    entry.modifier = decode_field<StorageEntryModifier>(reader, "modifier");
    {
        scale::FieldScope scope(reader, "ty");
        entry.ty = decode_storage_entry_type(reader);
    }
    entry.default_value = decode_field<std::vector<uint8_t>>(reader, "default");
    entry.docs = decode_field<std::vector<std::string>>(reader, "docs");
    return entry;
}

void PalletStorageMetadata::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, prefix);
    scale::encode(writer, entries);
}

PalletStorageMetadata PalletStorageMetadata::scale_decode(scale::Reader& reader) {
    PalletStorageMetadata storage;
    storage.prefix = decode_field<std::string>(reader, "prefix");
    storage.entries = decode_field<std::vector<StorageEntryMetadata>>(reader, "entries");
    return storage;
}

void visit_storage_type_refs(const StorageEntryType& ty, const std::string& where,
                             const TypeRefVisitor& visit) {
    if (const auto* plain = std::get_if<PlainStorageType>(&ty)) {
        visit(plain->value, where + ".Plain", false);
        return;
    }
    const auto& map = std::get<MapStorageType>(ty);
    visit(map.key, where + ".Map.key", false);
    visit(map.value, where + ".Map.value", false);
}

// =============================================================================
// Extension slots
// =============================================================================

void SignedExtensionMetadata::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, identifier);
    scale::encode(writer, ty);
    scale::encode(writer, additional_signed);
}

SignedExtensionMetadata SignedExtensionMetadata::scale_decode(scale::Reader& reader) {
    SignedExtensionMetadata extension;
    extension.identifier = decode_field<std::string>(reader, "identifier");
    extension.ty = decode_field<TypeId>(reader, "ty");
    extension.additional_signed = decode_field<TypeId>(reader, "additional_signed");
    return extension;
}

void RuntimeApiMethodParamMetadata::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, name);
    scale::encode(writer, ty);
}

RuntimeApiMethodParamMetadata RuntimeApiMethodParamMetadata::scale_decode(scale::Reader& reader) {
    RuntimeApiMethodParamMetadata param;
    param.name = decode_field<std::string>(reader, "name");
    param.ty = decode_field<TypeId>(reader, "ty");
    return param;
}

void OuterEnums::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, call_enum_ty);
    scale::encode(writer, event_enum_ty);
    scale::encode(writer, error_enum_ty);
}

OuterEnums OuterEnums::scale_decode(scale::Reader& reader) {
    OuterEnums outer;
    outer.call_enum_ty = decode_field<TypeId>(reader, "call_enum_ty");
    outer.event_enum_ty = decode_field<TypeId>(reader, "event_enum_ty");
    outer.error_enum_ty = decode_field<TypeId>(reader, "error_enum_ty");
    return outer;
}

void CustomValueMetadata::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, ty);
    scale::encode(writer, value);
}

CustomValueMetadata CustomValueMetadata::scale_decode(scale::Reader& reader) {
    CustomValueMetadata custom;
    custom.ty = decode_field<TypeId>(reader, "ty");
    custom.value = decode_field<std::vector<uint8_t>>(reader, "value");
    return custom;
}

void visit_outer_enum_refs(const OuterEnums& outer, const TypeRefVisitor& visit) {
    visit(outer.call_enum_ty, "outer_enums.call_enum_ty", true);
    visit(outer.event_enum_ty, "outer_enums.event_enum_ty", true);
    visit(outer.error_enum_ty, "outer_enums.error_enum_ty", true);
}

void visit_custom_refs(const CustomMetadata& custom, const TypeRefVisitor& visit) {
    for (const auto& [key, value] : custom.map) {
        visit(value.ty, "custom.map[" + key + "].ty", false);
    }
}

} // namespace ChainMeta::modern
