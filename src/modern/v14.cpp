#include "chainmeta/modern/v14.h"

#include "chainmeta/internal/debug.h"

namespace ChainMeta::v14 {

using scale::decode_field;

void PalletMetadata::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, name);
    scale::encode(writer, storage);
    scale::encode(writer, calls);
    scale::encode(writer, event);
    scale::encode(writer, constants);
    scale::encode(writer, error);
    writer.write_u8(index);
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
    return pallet;
}

void ExtrinsicMetadata::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, ty);
    writer.write_u8(version);
    scale::encode(writer, signed_extensions);
}

ExtrinsicMetadata ExtrinsicMetadata::scale_decode(scale::Reader& reader) {
    ExtrinsicMetadata extrinsic;
    extrinsic.ty = decode_field<TypeId>(reader, "ty");
    extrinsic.version = decode_field<uint8_t>(reader, "version");
    extrinsic.signed_extensions = decode_field<std::vector<SignedExtensionMetadata>>(reader, "signed_extensions");
    return extrinsic;
}

void RuntimeMetadataV14::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, types);
    scale::encode(writer, pallets);
    scale::encode(writer, extrinsic);
    scale::encode(writer, ty);
}

RuntimeMetadataV14 RuntimeMetadataV14::scale_decode(scale::Reader& reader) {
    RuntimeMetadataV14 metadata;
    metadata.types = decode_field<TypeRegistry>(reader, "types");
    metadata.pallets = decode_field<std::vector<PalletMetadata>>(reader, "pallets");
    metadata.extrinsic = decode_field<ExtrinsicMetadata>(reader, "extrinsic");
    metadata.ty = decode_field<TypeId>(reader, "ty");
    CMETA_DEBUG("decoded V14: %zu types, %zu pallets", metadata.types.size(), metadata.pallets.size());
    return metadata;
}

void RuntimeMetadataV14::for_each_type_ref(const modern::TypeRefVisitor& visit) const {
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
    visit(extrinsic.ty, "extrinsic.ty", false);
    for (const auto& extension : extrinsic.signed_extensions) {
        const std::string base = "extrinsic.signed_extensions[" + extension.identifier + "]";
        visit(extension.ty, base + ".ty", false);
        visit(extension.additional_signed, base + ".additional_signed", false);
    }
    visit(ty, "ty", false);
}

} // namespace ChainMeta::v14
