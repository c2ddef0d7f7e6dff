#include "chainmeta/modern/v15.h"

#include "chainmeta/internal/debug.h"

namespace ChainMeta::v15 {

using scale::decode_field;

void PalletMetadata::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, name);
    scale::encode(writer, storage);
    scale::encode(writer, calls);
    scale::encode(writer, event);
    scale::encode(writer, constants);
    scale::encode(writer, error);
    writer.write_u8(index);
    scale::encode(writer, docs);
}

PalletMetadata PalletMetadata::scale_decode(scale::Reader& reader) {
    PalletMetadata pallet;
    pallet.name = decode_field<std::string>(reader, "name");
    pallet.storage = decode_field<std::optional<PalletStorageMetadata>>(reader, "storage");
    pallet.calls = decode_field<std::optional<PalletCallMetadata>>(reader, "calls");
    pallet.event = decode_field<std::optional<PalletEventMetadata>>(reader, "event");
    pallet.constants = decode_field<std::vector<PalletConstantMetadata>>(reader, "constants");
    pallet.error = decode_field<std::optional<PalletErrorMetadata>>(reader, "error");
    pallet.index = decode_field<uint8_t>(reader, "index");
    pallet.docs = decode_field<std::vector<std::string>>(reader, "docs");
    return pallet;
}

void ExtrinsicMetadata::scale_encode(scale::Writer& writer) const {
    writer.write_u8(version);
    scale::encode(writer, address_ty);
    scale::encode(writer, call_ty);
    scale::encode(writer, signature_ty);
    scale::encode(writer, extra_ty);
    scale::encode(writer, signed_extensions);
}

ExtrinsicMetadata ExtrinsicMetadata::scale_decode(scale::Reader& reader) {
    ExtrinsicMetadata extrinsic;
    extrinsic.version = decode_field<uint8_t>(reader, "version");
    extrinsic.address_ty = decode_field<TypeId>(reader, "address_ty");
    extrinsic.call_ty = decode_field<TypeId>(reader, "call_ty");
    extrinsic.signature_ty = decode_field<TypeId>(reader, "signature_ty");
    extrinsic.extra_ty = decode_field<TypeId>(reader, "extra_ty");
    extrinsic.signed_extensions = decode_field<std::vector<SignedExtensionMetadata>>(reader, "signed_extensions");
    return extrinsic;
}

void RuntimeApiMethodMetadata::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, name);
    scale::encode(writer, inputs);
    scale::encode(writer, output);
    scale::encode(writer, docs);
}

RuntimeApiMethodMetadata RuntimeApiMethodMetadata::scale_decode(scale::Reader& reader) {
    RuntimeApiMethodMetadata method;
    method.name = decode_field<std::string>(reader, "name");
    method.inputs = decode_field<std::vector<RuntimeApiMethodParamMetadata>>(reader, "inputs");
    method.output = decode_field<TypeId>(reader, "output");
    method.docs = decode_field<std::vector<std::string>>(reader, "docs");
    return method;
}

void RuntimeApiMetadata::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, name);
    scale::encode(writer, methods);
    scale::encode(writer, docs);
}

RuntimeApiMetadata RuntimeApiMetadata::scale_decode(scale::Reader& reader) {
    RuntimeApiMetadata api;
    api.name = decode_field<std::string>(reader, "name");
    api.methods = decode_field<std::vector<RuntimeApiMethodMetadata>>(reader, "methods");
    api.docs = decode_field<std::vector<std::string>>(reader, "docs");
    return api;
}

void RuntimeMetadataV15::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, types);
    scale::encode(writer, pallets);
    scale::encode(writer, extrinsic);
    scale::encode(writer, ty);
    scale::encode(writer, apis);
    scale::encode(writer, outer_enums);
    scale::encode(writer, custom);
}

RuntimeMetadataV15 RuntimeMetadataV15::scale_decode(scale::Reader& reader) {
    RuntimeMetadataV15 metadata;
    metadata.types = decode_field<TypeRegistry>(reader, "types");
    metadata.pallets = decode_field<std::vector<PalletMetadata>>(reader, "pallets");
    metadata.extrinsic = decode_field<ExtrinsicMetadata>(reader, "extrinsic");
    metadata.ty = decode_field<TypeId>(reader, "ty");
    metadata.apis = decode_field<std::vector<RuntimeApiMetadata>>(reader, "apis");
    metadata.outer_enums = decode_field<OuterEnums>(reader, "outer_enums");
    metadata.custom = decode_field<CustomMetadata>(reader, "custom");
    CMETA_DEBUG("decoded V15: %zu types, %zu pallets, %zu apis",
                metadata.types.size(), metadata.pallets.size(), metadata.apis.size());
    return metadata;
}

void RuntimeMetadataV15::for_each_type_ref(const modern::TypeRefVisitor& visit) const {
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
    }

    visit(extrinsic.address_ty, "extrinsic.address_ty", true);
    visit(extrinsic.call_ty, "extrinsic.call_ty", true);
    visit(extrinsic.signature_ty, "extrinsic.signature_ty", true);
    visit(extrinsic.extra_ty, "extrinsic.extra_ty", true);
    for (const auto& extension : extrinsic.signed_extensions) {
        const std::string base = "extrinsic.signed_extensions[" + extension.identifier + "]";
        visit(extension.ty, base + ".ty", false);
        visit(extension.additional_signed, base + ".additional_signed", false);
    }
    visit(ty, "ty", false);

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

} // namespace ChainMeta::v15
