#ifndef CHAINMETA_MODERN_V15_H
#define CHAINMETA_MODERN_V15_H

#include "chainmeta/modern/common.h"

namespace ChainMeta::v15 {

using modern::CustomMetadata;
using modern::CustomValueMetadata;
using modern::OuterEnums;
using modern::PalletCallMetadata;
using modern::PalletConstantMetadata;
using modern::PalletErrorMetadata;
using modern::PalletEventMetadata;
using modern::PalletStorageMetadata;
using modern::RuntimeApiMethodParamMetadata;
using modern::SignedExtensionMetadata;
using modern::StorageEntryMetadata;

struct PalletMetadata {
    std::string name;
    std::optional<PalletStorageMetadata> storage;
    std::optional<PalletCallMetadata> calls;
    std::optional<PalletEventMetadata> event;
    std::vector<PalletConstantMetadata> constants;
    std::optional<PalletErrorMetadata> error;
    uint8_t index = 0;
    std::vector<std::string> docs;

    bool operator==(const PalletMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static PalletMetadata scale_decode(scale::Reader& reader);
};

/**
 * @brief Extrinsic format split into its parts.
 *
 * address_ty, call_ty, signature_ty and extra_ty may be
 * TypeId::unspecified() when converted from V14 metadata that did not name them.
 */
struct ExtrinsicMetadata {
    uint8_t version = 0;
    TypeId address_ty = TypeId::unspecified();
    TypeId call_ty = TypeId::unspecified();
    TypeId signature_ty = TypeId::unspecified();
    TypeId extra_ty = TypeId::unspecified();
    std::vector<SignedExtensionMetadata> signed_extensions;

    bool operator==(const ExtrinsicMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static ExtrinsicMetadata scale_decode(scale::Reader& reader);
};

struct RuntimeApiMethodMetadata {
    std::string name;
    std::vector<RuntimeApiMethodParamMetadata> inputs;
    TypeId output;
    std::vector<std::string> docs;

    bool operator==(const RuntimeApiMethodMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static RuntimeApiMethodMetadata scale_decode(scale::Reader& reader);
};

struct RuntimeApiMetadata {
    std::string name;
    std::vector<RuntimeApiMethodMetadata> methods;
    std::vector<std::string> docs;

    bool operator==(const RuntimeApiMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static RuntimeApiMetadata scale_decode(scale::Reader& reader);
};

struct RuntimeMetadataV15 {
    static constexpr uint8_t kVersion = 15;

    TypeRegistry types;
    std::vector<PalletMetadata> pallets;
    ExtrinsicMetadata extrinsic;
    TypeId ty;
    std::vector<RuntimeApiMetadata> apis;
    OuterEnums outer_enums;
    CustomMetadata custom;

    bool operator==(const RuntimeMetadataV15&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static RuntimeMetadataV15 scale_decode(scale::Reader& reader);

    void for_each_type_ref(const modern::TypeRefVisitor& visit) const;
    Outcome<void> validate() const { return modern::check_type_refs(*this, types); }
};

} // namespace ChainMeta::v15

#endif // CHAINMETA_MODERN_V15_H
