#include "chainmeta/json.h"

#include <string_view>

namespace ChainMeta {

using nlohmann::json;

namespace {

json tagged(std::string_view tag, json value) {
    json out = json::object();
    out[std::string(tag)] = std::move(value);
    return out;
}

json type_ref(TypeId id) {
    if (id.is_unspecified()) {
        return nullptr;
    }
    return id.value;
}

json optional_string(const std::optional<std::string>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

// Every overload is declared up front so the container helpers below can see all of them.

json to_value(const Field& field);
json to_value(const Variant& variant);
json to_value(const TypeParameter& param);
json to_value(const TypeDef& def);

json to_value(const legacy::FunctionArgumentMetadata& arg);
json to_value(const legacy::FunctionMetadata& function);
json to_value(const legacy::EventMetadata& event);
json to_value(const legacy::ModuleConstantMetadata& constant);
json to_value(const legacy::ErrorMetadata& error);
json to_value(const legacy::ExtrinsicMetadata& extrinsic);
json to_value(const legacy::StorageKey& key);
json to_value(const legacy::StorageEntryType& ty);
template<uint8_t V> json to_value(const legacy::StorageEntryMetadata<V>& entry);
template<uint8_t V> json to_value(const legacy::StorageMetadata<V>& storage);
template<uint8_t V, bool I> json to_value(const legacy::ModuleMetadata<V, I>& module);
template<uint8_t V, bool E> json to_value(const legacy::RuntimeMetadata<V, E>& metadata);

json to_value(const modern::PalletCallMetadata& calls);
json to_value(const modern::PalletEventMetadata& event);
json to_value(const modern::PalletErrorMetadata& error);
json to_value(const modern::PalletConstantMetadata& constant);
json to_value(const modern::StorageKeyType& key);
json to_value(const modern::StorageEntryType& ty);
json to_value(const modern::StorageEntryMetadata& entry);
json to_value(const modern::PalletStorageMetadata& storage);
json to_value(const modern::SignedExtensionMetadata& extension);
json to_value(const modern::RuntimeApiMethodParamMetadata& param);
json to_value(const modern::OuterEnums& outer);
json to_value(const modern::CustomMetadata& custom);

json to_value(const v14::PalletMetadata& pallet);
json to_value(const v14::ExtrinsicMetadata& extrinsic);

json to_value(const v15::PalletMetadata& pallet);
json to_value(const v15::ExtrinsicMetadata& extrinsic);
json to_value(const v15::RuntimeApiMethodMetadata& method);
json to_value(const v15::RuntimeApiMetadata& api);

json to_value(const v16::DeprecationStatus& status);
json to_value(const v16::DeprecationInfo& info);
json to_value(const v16::StorageEntryMetadata& entry);
json to_value(const v16::PalletStorageMetadata& storage);
json to_value(const v16::PalletCallMetadata& calls);
json to_value(const v16::PalletEventMetadata& event);
json to_value(const v16::PalletErrorMetadata& error);
json to_value(const v16::PalletConstantMetadata& constant);
json to_value(const v16::PalletAssociatedTypeMetadata& associated);
json to_value(const v16::PalletViewFunctionMetadata& view);
json to_value(const v16::PalletMetadata& pallet);
json to_value(const v16::TransactionExtensionMetadata& extension);
json to_value(const v16::ExtrinsicMetadata& extrinsic);
json to_value(const v16::RuntimeApiMethodMetadata& method);
json to_value(const v16::RuntimeApiMetadata& api);

template<typename T>
json list(const std::vector<T>& items) {
    json out = json::array();
    for (const auto& item : items) {
        out.push_back(to_value(item));
    }
    return out;
}

template<typename T>
json optional_value(const std::optional<T>& value) {
    if (!value) {
        return nullptr;
    }
    return to_value(*value);
}

json type_refs(const std::vector<TypeId>& ids) {
    json out = json::array();
    for (TypeId id : ids) {
        out.push_back(type_ref(id));
    }
    return out;
}

// =============================================================================
// Type registry
// =============================================================================

json to_value(const Field& field) {
    return json{{"name", optional_string(field.name)},
                {"ty", type_ref(field.ty)},
                {"type_name", optional_string(field.type_name)},
                {"docs", field.docs}};
}

json to_value(const Variant& variant) {
    return json{{"name", variant.name},
                {"fields", list(variant.fields)},
                {"index", variant.index},
                {"docs", variant.docs}};
}

json to_value(const TypeParameter& param) {
    json ty = param.ty ? type_ref(*param.ty) : json(nullptr);
    return json{{"name", param.name}, {"ty", std::move(ty)}};
}

json to_value(const TypeDef& def) {
    return std::visit([](const auto& d) -> json {
        using D = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<D, TypeDefComposite>) {
            return tagged("Composite", json{{"fields", list(d.fields)}});
        } else if constexpr (std::is_same_v<D, TypeDefVariant>) {
            return tagged("Variant", json{{"variants", list(d.variants)}});
        } else if constexpr (std::is_same_v<D, TypeDefSequence>) {
            return tagged("Sequence", json{{"element", type_ref(d.element)}});
        } else if constexpr (std::is_same_v<D, TypeDefArray>) {
            return tagged("Array", json{{"len", d.len}, {"element", type_ref(d.element)}});
        } else if constexpr (std::is_same_v<D, TypeDefTuple>) {
            return tagged("Tuple", type_refs(d.elements));
        } else if constexpr (std::is_same_v<D, TypeDefPrimitive>) {
            return tagged("Primitive", primitive_name(d.primitive));
        } else if constexpr (std::is_same_v<D, TypeDefCompact>) {
            return tagged("Compact", json{{"inner", type_ref(d.inner)}});
        } else {
            return tagged("BitSequence",
                          json{{"bit_store", type_ref(d.bit_store)}, {"bit_order", type_ref(d.bit_order)}});
        }
    }, def);
}

// =============================================================================
// String-typed versions
// =============================================================================

json to_value(const legacy::FunctionArgumentMetadata& arg) {
    return json{{"name", arg.name}, {"ty", arg.ty}};
}

json to_value(const legacy::FunctionMetadata& function) {
    return json{{"name", function.name},
                {"arguments", list(function.arguments)},
                {"documentation", function.documentation}};
}

json to_value(const legacy::EventMetadata& event) {
    return json{{"name", event.name}, {"arguments", event.arguments}, {"documentation", event.documentation}};
}

json to_value(const legacy::ModuleConstantMetadata& constant) {
    return json{{"name", constant.name},
                {"ty", constant.ty},
                {"value", to_hex(constant.value)},
                {"documentation", constant.documentation}};
}

json to_value(const legacy::ErrorMetadata& error) {
    return json{{"name", error.name}, {"documentation", error.documentation}};
}

json to_value(const legacy::ExtrinsicMetadata& extrinsic) {
    return json{{"version", extrinsic.version}, {"signed_extensions", extrinsic.signed_extensions}};
}

json to_value(const legacy::StorageKey& key) {
    return json{{"hasher", hasher_name(key.hasher)}, {"key", key.key}};
}

json to_value(const legacy::StorageEntryType& ty) {
    if (const auto* plain = std::get_if<legacy::PlainStorage>(&ty)) {
        return tagged("Plain", plain->value);
    }
    const auto& map = std::get<legacy::MapStorage>(ty);
    json body{{"keys", list(map.keys)}, {"value", map.value}};
    if (map.shape == legacy::MapShape::Map) {
        body["is_linked"] = map.is_linked;
    }
    return tagged(legacy::map_shape_name(map.shape), std::move(body));
}

template<uint8_t V>
json to_value(const legacy::StorageEntryMetadata<V>& entry) {
    return json{{"name", entry.name},
                {"modifier", modifier_name(entry.modifier)},
                {"ty", to_value(entry.ty)},
                {"default", to_hex(entry.default_value)},
                {"documentation", entry.documentation}};
}

template<uint8_t V>
json to_value(const legacy::StorageMetadata<V>& storage) {
    return json{{"prefix", storage.prefix}, {"entries", list(storage.entries)}};
}

template<uint8_t V, bool I>
json to_value(const legacy::ModuleMetadata<V, I>& module) {
    json out{{"name", module.name},
             {"storage", optional_value(module.storage)},
             {"calls", module.calls ? list(*module.calls) : json(nullptr)},
             {"event", module.event ? list(*module.event) : json(nullptr)},
             {"constants", list(module.constants)},
             {"errors", list(module.errors)}};
    if constexpr (I) {
        out["index"] = module.index;
    }
    return out;
}

template<uint8_t V, bool E>
json to_value(const legacy::RuntimeMetadata<V, E>& metadata) {
    json out{{"modules", list(metadata.modules)}};
    if constexpr (E) {
        out["extrinsic"] = to_value(metadata.extrinsic);
    }
    return out;
}

// =============================================================================
// Registry-backed versions
// =============================================================================

json to_value(const modern::PalletCallMetadata& calls) {
    return json{{"ty", type_ref(calls.ty)}};
}

json to_value(const modern::PalletEventMetadata& event) {
    return json{{"ty", type_ref(event.ty)}};
}

json to_value(const modern::PalletErrorMetadata& error) {
    return json{{"ty", type_ref(error.ty)}};
}

json to_value(const modern::PalletConstantMetadata& constant) {
    return json{{"name", constant.name},
                {"ty", type_ref(constant.ty)},
                {"value", to_hex(constant.value)},
                {"docs", constant.docs}};
}

json to_value(const modern::StorageKeyType& key) {
    return json{{"hasher", hasher_name(key.hasher)}, {"key", type_ref(key.key)}};
}

json to_value(const modern::StorageEntryType& ty) {
    if (const auto* plain = std::get_if<modern::PlainStorageType>(&ty)) {
        return tagged("Plain", type_ref(plain->value));
    }
    const auto& map = std::get<modern::MapStorageType>(ty);
    json hashers = json::array();
    for (StorageHasher hasher : map.hashers) {
        hashers.push_back(hasher_name(hasher));
    }
    return tagged("Map", json{{"hashers", std::move(hashers)},
                              {"key", type_ref(map.key)},
                              {"value", type_ref(map.value)}});
}

json to_value(const modern::StorageEntryMetadata& entry) {
    return json{{"name", entry.name},
                {"modifier", modifier_name(entry.modifier)},
                {"ty", to_value(entry.ty)},
                {"default", to_hex(entry.default_value)},
                {"docs", entry.docs}};
}

json to_value(const modern::PalletStorageMetadata& storage) {
    return json{{"prefix", storage.prefix}, {"entries", list(storage.entries)}};
}

json to_value(const modern::SignedExtensionMetadata& extension) {
    return json{{"identifier", extension.identifier},
                {"ty", type_ref(extension.ty)},
                {"additional_signed", type_ref(extension.additional_signed)}};
}

json to_value(const modern::RuntimeApiMethodParamMetadata& param) {
    return json{{"name", param.name}, {"ty", type_ref(param.ty)}};
}

json to_value(const modern::OuterEnums& outer) {
    return json{{"call_enum_ty", type_ref(outer.call_enum_ty)},
                {"event_enum_ty", type_ref(outer.event_enum_ty)},
                {"error_enum_ty", type_ref(outer.error_enum_ty)}};
}

json to_value(const modern::CustomMetadata& custom) {
    json map = json::object();
    for (const auto& [name, entry] : custom.map) {
        map[name] = json{{"ty", type_ref(entry.ty)}, {"value", to_hex(entry.value)}};
    }
    return json{{"map", std::move(map)}};
}

json to_value(const v14::PalletMetadata& pallet) {
    return json{{"name", pallet.name},
                {"storage", optional_value(pallet.storage)},
                {"calls", optional_value(pallet.calls)},
                {"event", optional_value(pallet.event)},
                {"constants", list(pallet.constants)},
                {"error", optional_value(pallet.error)},
                {"index", pallet.index}};
}

json to_value(const v14::ExtrinsicMetadata& extrinsic) {
    return json{{"ty", type_ref(extrinsic.ty)},
                {"version", extrinsic.version},
                {"signed_extensions", list(extrinsic.signed_extensions)}};
}

json to_value(const v15::PalletMetadata& pallet) {
    return json{{"name", pallet.name},
                {"storage", optional_value(pallet.storage)},
                {"calls", optional_value(pallet.calls)},
                {"event", optional_value(pallet.event)},
                {"constants", list(pallet.constants)},
                {"error", optional_value(pallet.error)},
                {"index", pallet.index},
                {"docs", pallet.docs}};
}

json to_value(const v15::ExtrinsicMetadata& extrinsic) {
    return json{{"version", extrinsic.version},
                {"address_ty", type_ref(extrinsic.address_ty)},
                {"call_ty", type_ref(extrinsic.call_ty)},
                {"signature_ty", type_ref(extrinsic.signature_ty)},
                {"extra_ty", type_ref(extrinsic.extra_ty)},
                {"signed_extensions", list(extrinsic.signed_extensions)}};
}

json to_value(const v15::RuntimeApiMethodMetadata& method) {
    return json{{"name", method.name},
                {"inputs", list(method.inputs)},
                {"output", type_ref(method.output)},
                {"docs", method.docs}};
}

json to_value(const v15::RuntimeApiMetadata& api) {
    return json{{"name", api.name}, {"methods", list(api.methods)}, {"docs", api.docs}};
}

// ---- V16 ----

json to_value(const v16::DeprecationStatus& status) {
    using Kind = v16::DeprecationStatus::Kind;
    switch (status.kind) {
        case Kind::NotDeprecated: return "NotDeprecated";
        case Kind::DeprecatedWithoutNote: return "DeprecatedWithoutNote";
        case Kind::Deprecated: break;
    }
    return tagged("Deprecated", json{{"note", status.note}, {"since", optional_string(status.since)}});
}

json to_value(const v16::DeprecationInfo& info) {
    using Kind = v16::DeprecationInfo::Kind;
    switch (info.kind) {
        case Kind::NotDeprecated: return "NotDeprecated";
        case Kind::ItemDeprecated: return tagged("ItemDeprecated", to_value(info.item));
        case Kind::VariantsDeprecated: break;
    }
    json variants = json::object();
    for (const auto& [index, status] : info.variants) {
        variants[std::to_string(index)] = to_value(status);
    }
    return tagged("VariantsDeprecated", std::move(variants));
}

json to_value(const v16::StorageEntryMetadata& entry) {
    return json{{"name", entry.name},
                {"modifier", modifier_name(entry.modifier)},
                {"ty", to_value(entry.ty)},
                {"default", to_hex(entry.default_value)},
                {"docs", entry.docs},
                {"deprecation_info", to_value(entry.deprecation_info)}};
}

json to_value(const v16::PalletStorageMetadata& storage) {
    return json{{"prefix", storage.prefix}, {"entries", list(storage.entries)}};
}

json to_value(const v16::PalletCallMetadata& calls) {
    return json{{"ty", type_ref(calls.ty)}, {"deprecation_info", to_value(calls.deprecation_info)}};
}

json to_value(const v16::PalletEventMetadata& event) {
    return json{{"ty", type_ref(event.ty)}, {"deprecation_info", to_value(event.deprecation_info)}};
}

json to_value(const v16::PalletErrorMetadata& error) {
    return json{{"ty", type_ref(error.ty)}, {"deprecation_info", to_value(error.deprecation_info)}};
}

json to_value(const v16::PalletConstantMetadata& constant) {
    return json{{"name", constant.name},
                {"ty", type_ref(constant.ty)},
                {"value", to_hex(constant.value)},
                {"docs", constant.docs},
                {"deprecation_info", to_value(constant.deprecation_info)}};
}

json to_value(const v16::PalletAssociatedTypeMetadata& associated) {
    return json{{"name", associated.name}, {"ty", type_ref(associated.ty)}, {"docs", associated.docs}};
}

json to_value(const v16::PalletViewFunctionMetadata& view) {
    return json{{"name", view.name},
                {"id", to_hex(view.id)},
                {"inputs", list(view.inputs)},
                {"output", type_ref(view.output)},
                {"docs", view.docs},
                {"deprecation_info", to_value(view.deprecation_info)}};
}

json to_value(const v16::PalletMetadata& pallet) {
    return json{{"name", pallet.name},
                {"storage", optional_value(pallet.storage)},
                {"calls", optional_value(pallet.calls)},
                {"event", optional_value(pallet.event)},
                {"constants", list(pallet.constants)},
                {"error", optional_value(pallet.error)},
                {"associated_types", list(pallet.associated_types)},
                {"view_functions", list(pallet.view_functions)},
                {"index", pallet.index},
                {"docs", pallet.docs},
                {"deprecation_info", to_value(pallet.deprecation_info)}};
}

json to_value(const v16::TransactionExtensionMetadata& extension) {
    return json{{"identifier", extension.identifier},
                {"ty", type_ref(extension.ty)},
                {"implicit", type_ref(extension.implicit)}};
}

json to_value(const v16::ExtrinsicMetadata& extrinsic) {
    json by_version = json::object();
    for (const auto& [version, indices] : extrinsic.transaction_extensions_by_version) {
        json list_of_indices = json::array();
        for (const auto& index : indices) {
            list_of_indices.push_back(index.value);
        }
        by_version[std::to_string(version)] = std::move(list_of_indices);
    }
    return json{{"versions", extrinsic.versions},
                {"address_ty", type_ref(extrinsic.address_ty)},
                {"signature_ty", type_ref(extrinsic.signature_ty)},
                {"transaction_extensions_by_version", std::move(by_version)},
                {"transaction_extensions", list(extrinsic.transaction_extensions)}};
}

json to_value(const v16::RuntimeApiMethodMetadata& method) {
    return json{{"name", method.name},
                {"inputs", list(method.inputs)},
                {"output", type_ref(method.output)},
                {"docs", method.docs},
                {"deprecation_info", to_value(method.deprecation_info)}};
}

json to_value(const v16::RuntimeApiMetadata& api) {
    return json{{"name", api.name},
                {"methods", list(api.methods)},
                {"docs", api.docs},
                {"deprecation_info", to_value(api.deprecation_info)},
                {"version", api.version}};
}

} // namespace

std::string to_hex(std::span<const uint8_t> bytes) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + bytes.size() * 2);
    for (uint8_t byte : bytes) {
        out.push_back(kDigits[byte >> 4]);
        out.push_back(kDigits[byte & 0x0F]);
    }
    return out;
}

json to_json(const TypeDescriptor& descriptor) {
    return json{{"path", descriptor.path},
                {"type_params", list(descriptor.type_params)},
                {"def", to_value(descriptor.def)},
                {"docs", descriptor.docs}};
}

json to_json(const TypeRegistry& registry) {
    json out = json::array();
    for (const auto& entry : registry.types()) {
        out.push_back(json{{"id", entry.id.value}, {"type", to_json(entry.type)}});
    }
    return out;
}

json to_json(const v8::RuntimeMetadataV8& metadata) { return to_value(metadata); }
json to_json(const v9::RuntimeMetadataV9& metadata) { return to_value(metadata); }
json to_json(const v10::RuntimeMetadataV10& metadata) { return to_value(metadata); }
json to_json(const v11::RuntimeMetadataV11& metadata) { return to_value(metadata); }
json to_json(const v12::RuntimeMetadataV12& metadata) { return to_value(metadata); }
json to_json(const v13::RuntimeMetadataV13& metadata) { return to_value(metadata); }

json to_json(const v14::RuntimeMetadataV14& metadata) {
    return json{{"types", to_json(metadata.types)},
                {"pallets", list(metadata.pallets)},
                {"extrinsic", to_value(metadata.extrinsic)},
                {"ty", type_ref(metadata.ty)}};
}

json to_json(const v15::RuntimeMetadataV15& metadata) {
    return json{{"types", to_json(metadata.types)},
                {"pallets", list(metadata.pallets)},
                {"extrinsic", to_value(metadata.extrinsic)},
                {"ty", type_ref(metadata.ty)},
                {"apis", list(metadata.apis)},
                {"outer_enums", to_value(metadata.outer_enums)},
                {"custom", to_value(metadata.custom)}};
}

json to_json(const v16::RuntimeMetadataV16& metadata) {
    return json{{"types", to_json(metadata.types)},
                {"pallets", list(metadata.pallets)},
                {"extrinsic", to_value(metadata.extrinsic)},
                {"apis", list(metadata.apis)},
                {"outer_enums", to_value(metadata.outer_enums)},
                {"custom", to_value(metadata.custom)}};
}

json to_json(const RuntimeMetadata& metadata) {
    return std::visit([](const auto& tree) {
        using T = std::decay_t<decltype(tree)>;
        return tagged("V" + std::to_string(T::kVersion), to_json(tree));
    }, metadata);
}

json to_json(const RuntimeMetadataPrefixed& prefixed) {
    return json{{"magic", prefixed.magic}, {"metadata", to_json(prefixed.metadata)}};
}

json to_json(const MetadataError& error) {
    json out{{"kind", error_kind_name(error.kind)}, {"message", error.message}};
    if (error.version) {
        out["version"] = *error.version;
    }
    if (error.offset) {
        out["offset"] = *error.offset;
    }
    if (!error.field_path.empty()) {
        out["field_path"] = error.field_path;
    }
    if (error.type_id) {
        out["type_id"] = *error.type_id;
    }
    return out;
}

std::string to_json_string(const RuntimeMetadataPrefixed& prefixed, int indent) {
    return to_json(prefixed).dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace ChainMeta
