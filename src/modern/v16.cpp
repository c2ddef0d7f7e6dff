#include "chainmeta/modern/v16.h"

#include "chainmeta/internal/debug.h"
#include "chainmeta/logger.h"

namespace ChainMeta::v16 {

using scale::decode_field;

// =============================================================================
// Deprecation
// =============================================================================

void DeprecationStatus::scale_encode(scale::Writer& writer) const {
    if (kind != Kind::Deprecated && (!note.empty() || since.has_value())) {
        throw scale::EncodeError("DeprecationStatus carries a note but is not Deprecated");
    }
    writer.write_u8(static_cast<uint8_t>(kind));
    if (kind == Kind::Deprecated) {
        scale::encode(writer, note);
        scale::encode(writer, since);
    }
}

DeprecationStatus DeprecationStatus::scale_decode(scale::Reader& reader) {
    DeprecationStatus status;
    status.kind = static_cast<Kind>(reader.read_tag("DeprecationStatus", 2));
    if (status.kind == Kind::Deprecated) {
        status.note = decode_field<std::string>(reader, "note");
        status.since = decode_field<std::optional<std::string>>(reader, "since");
    }
    return status;
}

void DeprecationInfo::scale_encode(scale::Writer& writer) const {
    if (kind != Kind::ItemDeprecated && item != DeprecationStatus{}) {
        throw scale::EncodeError("DeprecationInfo carries an item status but is not ItemDeprecated");
    }
    if (kind != Kind::VariantsDeprecated && !variants.empty()) {
        throw scale::EncodeError("DeprecationInfo carries variants but is not VariantsDeprecated");
    }
    writer.write_u8(static_cast<uint8_t>(kind));
    switch (kind) {
        case Kind::NotDeprecated:
            break;
        case Kind::ItemDeprecated:
            scale::encode(writer, item);
            break;
        case Kind::VariantsDeprecated:
            scale::encode(writer, variants);
            break;
    }
}

DeprecationInfo DeprecationInfo::scale_decode(scale::Reader& reader) {
    DeprecationInfo info;
    info.kind = static_cast<Kind>(reader.read_tag("DeprecationInfo", 2));
    if (info.kind == Kind::ItemDeprecated) {
        info.item = decode_field<DeprecationStatus>(reader, "ItemDeprecated");
    } else if (info.kind == Kind::VariantsDeprecated) {
        info.variants = decode_field<std::map<uint8_t, DeprecationStatus>>(reader, "VariantsDeprecated");
    }
    return info;
}

// =============================================================================
// Pallets
// =============================================================================

void StorageEntryMetadata::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, name);
    scale::encode(writer, modifier);
    modern::encode_storage_entry_type(writer, ty);
    scale::encode(writer, default_value);
    scale::encode(writer, docs);
    scale::encode(writer, deprecation_info);
}

StorageEntryMetadata StorageEntryMetadata::scale_decode(scale::Reader& reader) {
    StorageEntryMetadata entry;
    entry.name = decode_field<std::string>(reader, "name");
    entry.modifier = decode_field<StorageEntryModifier>(reader, "modifier");
    {
        scale::FieldScope scope(reader, "ty");
        entry.ty = modern::decode_storage_entry_type(reader);
    }
    entry.default_value = decode_field<std::vector<uint8_t>>(reader, "default");
    entry.docs = decode_field<std::vector<std::string>>(reader, "docs");
    entry.deprecation_info = decode_field<DeprecationStatus>(reader, "deprecation_info");
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

void PalletCallMetadata::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, ty);
    scale::encode(writer, deprecation_info);
}

PalletCallMetadata PalletCallMetadata::scale_decode(scale::Reader& reader) {
    PalletCallMetadata calls;
    calls.ty = decode_field<TypeId>(reader, "ty");
    calls.deprecation_info = decode_field<DeprecationInfo>(reader, "deprecation_info");
    return calls;
}

void PalletEventMetadata::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, ty);
    scale::encode(writer, deprecation_info);
}

PalletEventMetadata PalletEventMetadata::scale_decode(scale::Reader& reader) {
    PalletEventMetadata event;
    event.ty = decode_field<TypeId>(reader, "ty");
    event.deprecation_info = decode_field<DeprecationInfo>(reader, "deprecation_info");
    return event;
}

void PalletErrorMetadata::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, ty);
    scale::encode(writer, deprecation_info);
}

PalletErrorMetadata PalletErrorMetadata::scale_decode(scale::Reader& reader) {
    PalletErrorMetadata error;
    error.ty = decode_field<TypeId>(reader, "ty");
    error.deprecation_info = decode_field<DeprecationInfo>(reader, "deprecation_info");
    return error;
}

void PalletConstantMetadata::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, name);
    scale::encode(writer, ty);
    scale::encode(writer, value);
    scale::encode(writer, docs);
    scale::encode(writer, deprecation_info);
}

PalletConstantMetadata PalletConstantMetadata::scale_decode(scale::Reader& reader) {
    PalletConstantMetadata constant;
    constant.name = decode_field<std::string>(reader, "name");
    constant.ty = decode_field<TypeId>(reader, "ty");
    constant.value = decode_field<std::vector<uint8_t>>(reader, "value");
    constant.docs = decode_field<std::vector<std::string>>(reader, "docs");
    constant.deprecation_info = decode_field<DeprecationStatus>(reader, "deprecation_info");
    return constant;
}

void PalletAssociatedTypeMetadata::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, name);
    scale::encode(writer, ty);
    scale::encode(writer, docs);
}

PalletAssociatedTypeMetadata PalletAssociatedTypeMetadata::scale_decode(scale::Reader& reader) {
    PalletAssociatedTypeMetadata associated;
    associated.name = decode_field<std::string>(reader, "name");
    associated.ty = decode_field<TypeId>(reader, "ty");
    associated.docs = decode_field<std::vector<std::string>>(reader, "docs");
    return associated;
}

void PalletViewFunctionMetadata::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, name);
    scale::encode(writer, id);
    scale::encode(writer, inputs);
    scale::encode(writer, output);
    scale::encode(writer, docs);
    scale::encode(writer, deprecation_info);
}

PalletViewFunctionMetadata PalletViewFunctionMetadata::scale_decode(scale::Reader& reader) {
    PalletViewFunctionMetadata view;
    view.name = decode_field<std::string>(reader, "name");
    view.id = decode_field<std::array<uint8_t, 32>>(reader, "id");
    view.inputs = decode_field<std::vector<RuntimeApiMethodParamMetadata>>(reader, "inputs");
    view.output = decode_field<TypeId>(reader, "output");
    view.docs = decode_field<std::vector<std::string>>(reader, "docs");
    view.deprecation_info = decode_field<DeprecationStatus>(reader, "deprecation_info");
    return view;
}

void PalletMetadata::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, name);
    scale::encode(writer, storage);
    scale::encode(writer, calls);
    scale::encode(writer, event);
    scale::encode(writer, constants);
    scale::encode(writer, error);
    scale::encode(writer, associated_types);
    scale::encode(writer, view_functions);
    writer.write_u8(index);
    scale::encode(writer, docs);
    scale::encode(writer, deprecation_info);
}

PalletMetadata PalletMetadata::scale_decode(scale::Reader& reader) {
    PalletMetadata pallet;
    pallet.name = decode_field<std::string>(reader, "name");
    pallet.storage = decode_field<std::optional<PalletStorageMetadata>>(reader, "storage");
    pallet.calls = decode_field<std::optional<PalletCallMetadata>>(reader, "calls");
    pallet.event = decode_field<std::optional<PalletEventMetadata>>(reader, "event");
    pallet.constants = decode_field<std::vector<PalletConstantMetadata>>(reader, "constants");
    pallet.error = decode_field<std::optional<PalletErrorMetadata>>(reader, "error");
    pallet.associated_types = decode_field<std::vector<PalletAssociatedTypeMetadata>>(reader, "associated_types");
    pallet.view_functions = decode_field<std::vector<PalletViewFunctionMetadata>>(reader, "view_functions");
    pallet.index = decode_field<uint8_t>(reader, "index");
    pallet.docs = decode_field<std::vector<std::string>>(reader, "docs");
    pallet.deprecation_info = decode_field<DeprecationStatus>(reader, "deprecation_info");
    return pallet;
}

// =============================================================================
// Extrinsic and runtime APIs
// =============================================================================

void TransactionExtensionMetadata::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, identifier);
    scale::encode(writer, ty);
    scale::encode(writer, implicit);
}

TransactionExtensionMetadata TransactionExtensionMetadata::scale_decode(scale::Reader& reader) {
    TransactionExtensionMetadata extension;
    extension.identifier = decode_field<std::string>(reader, "identifier");
    extension.ty = decode_field<TypeId>(reader, "ty");
    extension.implicit = decode_field<TypeId>(reader, "implicit");
    return extension;
}

void ExtrinsicMetadata::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, versions);
    scale::encode(writer, address_ty);
    scale::encode(writer, signature_ty);
    scale::encode(writer, transaction_extensions_by_version);
    scale::encode(writer, transaction_extensions);
}

ExtrinsicMetadata ExtrinsicMetadata::scale_decode(scale::Reader& reader) {
    ExtrinsicMetadata extrinsic;
    extrinsic.versions = decode_field<std::vector<uint8_t>>(reader, "versions");
    extrinsic.address_ty = decode_field<TypeId>(reader, "address_ty");
    extrinsic.signature_ty = decode_field<TypeId>(reader, "signature_ty");
    extrinsic.transaction_extensions_by_version =
        decode_field<std::map<uint8_t, std::vector<scale::Compact<uint32_t>>>>(reader, "transaction_extensions_by_version");
    extrinsic.transaction_extensions =
        decode_field<std::vector<TransactionExtensionMetadata>>(reader, "transaction_extensions");
    return extrinsic;
}

void RuntimeApiMethodMetadata::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, name);
    scale::encode(writer, inputs);
    scale::encode(writer, output);
    scale::encode(writer, docs);
    scale::encode(writer, deprecation_info);
}

RuntimeApiMethodMetadata RuntimeApiMethodMetadata::scale_decode(scale::Reader& reader) {
    RuntimeApiMethodMetadata method;
    method.name = decode_field<std::string>(reader, "name");
    method.inputs = decode_field<std::vector<RuntimeApiMethodParamMetadata>>(reader, "inputs");
    method.output = decode_field<TypeId>(reader, "output");
    method.docs = decode_field<std::vector<std::string>>(reader, "docs");
    method.deprecation_info = decode_field<DeprecationStatus>(reader, "deprecation_info");
    return method;
}

void RuntimeApiMetadata::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, name);
    scale::encode(writer, methods);
    scale::encode(writer, docs);
    scale::encode(writer, deprecation_info);
    writer.write_compact(version);
}

RuntimeApiMetadata RuntimeApiMetadata::scale_decode(scale::Reader& reader) {
    RuntimeApiMetadata api;
    api.name = decode_field<std::string>(reader, "name");
    api.methods = decode_field<std::vector<RuntimeApiMethodMetadata>>(reader, "methods");
    api.docs = decode_field<std::vector<std::string>>(reader, "docs");
    api.deprecation_info = decode_field<DeprecationStatus>(reader, "deprecation_info");
    api.version = decode_field<scale::Compact<uint32_t>>(reader, "version").value;
    return api;
}

// =============================================================================
// Top level
// =============================================================================

void RuntimeMetadataV16::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, types);
    scale::encode(writer, pallets);
    scale::encode(writer, extrinsic);
    scale::encode(writer, apis);
    scale::encode(writer, outer_enums);
    scale::encode(writer, custom);
}

RuntimeMetadataV16 RuntimeMetadataV16::scale_decode(scale::Reader& reader) {
    RuntimeMetadataV16 metadata;
    metadata.types = decode_field<TypeRegistry>(reader, "types");
    metadata.pallets = decode_field<std::vector<PalletMetadata>>(reader, "pallets");
    metadata.extrinsic = decode_field<ExtrinsicMetadata>(reader, "extrinsic");
    metadata.apis = decode_field<std::vector<RuntimeApiMetadata>>(reader, "apis");
    metadata.outer_enums = decode_field<OuterEnums>(reader, "outer_enums");
    metadata.custom = decode_field<CustomMetadata>(reader, "custom");
    CMETA_DEBUG("decoded V16: %zu types, %zu pallets, %zu apis",
                metadata.types.size(), metadata.pallets.size(), metadata.apis.size());
    return metadata;
}

void RuntimeMetadataV16::for_each_type_ref(const modern::TypeRefVisitor& visit) const {
    for (const auto& pallet : pallets) {
        const std::string base = "pallets[" + pallet.name + "]";
        if (pallet.storage) {
            for (const auto& entry : pallet.storage->entries) {
                modern::visit_storage_type_refs(entry.ty, base + ".storage[" + entry.name + "].ty", visit);
            }
        }
        if (pallet.calls) visit(pallet.calls->ty, base + ".calls.ty", false);
        if (pallet.event) visit(pallet.event->ty, base + ".event.ty", false);
        for (const auto& constant : pallet.constants) {
            visit(constant.ty, base + ".constants[" + constant.name + "].ty", false);
        }
        if (pallet.error) visit(pallet.error->ty, base + ".error.ty", false);
        for (const auto& associated : pallet.associated_types) {
            visit(associated.ty, base + ".associated_types[" + associated.name + "].ty", false);
        }
        for (const auto& view : pallet.view_functions) {
            const std::string view_base = base + ".view_functions[" + view.name + "]";
            for (const auto& input : view.inputs) {
                visit(input.ty, view_base + ".inputs[" + input.name + "]", false);
            }
            visit(view.output, view_base + ".output", false);
        }
    }

    visit(extrinsic.address_ty, "extrinsic.address_ty", true);
    visit(extrinsic.signature_ty, "extrinsic.signature_ty", true);
    for (const auto& extension : extrinsic.transaction_extensions) {
        const std::string base = "extrinsic.transaction_extensions[" + extension.identifier + "]";
        visit(extension.ty, base + ".ty", false);
        visit(extension.implicit, base + ".implicit", false);
    }

    for (const auto& api : apis) {
        for (const auto& method : api.methods) {
            const std::string base = "apis[" + api.name + "]." + method.name;
            for (const auto& input : method.inputs) {
                visit(input.ty, base + ".inputs[" + input.name + "]", false);
            }
            visit(method.output, base + ".output", false);
        }
    }
    modern::visit_outer_enum_refs(outer_enums, visit);
    modern::visit_custom_refs(custom, visit);
}

Outcome<void> RuntimeMetadataV16::validate() const {
    auto closed = modern::check_type_refs(*this, types);
    if (closed.is_err()) {
        return closed;
    }
    for (const auto& [version, indices] : extrinsic.transaction_extensions_by_version) {
        for (const auto& index : indices) {
            if (index.value >= extrinsic.transaction_extensions.size()) {
                MetadataError err = MetadataError::malformed(detail::format(
                    "transaction extension index %u is out of range (%zu extensions)",
                    index.value, extrinsic.transaction_extensions.size()));
                err.version = kVersion;
                err.field_path = detail::format("extrinsic.transaction_extensions_by_version[%u]",
                                                static_cast<unsigned>(version));
                return err;
            }
        }
    }
    return Ok();
}

} // namespace ChainMeta::v16
