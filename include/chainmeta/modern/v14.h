#ifndef CHAINMETA_MODERN_V14_H
#define CHAINMETA_MODERN_V14_H

#include "chainmeta/modern/common.h"

namespace ChainMeta::v14 {

using modern::PalletCallMetadata;
using modern::PalletConstantMetadata;
using modern::PalletErrorMetadata;
using modern::PalletEventMetadata;
using modern::PalletStorageMetadata;
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

    bool operator==(const PalletMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static PalletMetadata scale_decode(scale::Reader& reader);
};

/// ty is the type of the whole extrinsic; its generic parameters name the parts.
struct ExtrinsicMetadata {
    TypeId ty;
    uint8_t version = 0;
    std::vector<SignedExtensionMetadata> signed_extensions;

    bool operator==(const ExtrinsicMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static ExtrinsicMetadata scale_decode(scale::Reader& reader);
};

/**
 * @brief First registry-backed schema.
 *
 * Wire order: types, pallets, extrinsic, ty (the runtime type).
 */
struct RuntimeMetadataV14 {
    static constexpr uint8_t kVersion = 14;

    TypeRegistry types;
    std::vector<PalletMetadata> pallets;
    ExtrinsicMetadata extrinsic;
    TypeId ty;

    bool operator==(const RuntimeMetadataV14&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static RuntimeMetadataV14 scale_decode(scale::Reader& reader);

    void for_each_type_ref(const modern::TypeRefVisitor& visit) const;

    /// Closed-world check of the registry and of every reference in the tree.
    Outcome<void> validate() const { return modern::check_type_refs(*this, types); }
};

} // namespace ChainMeta::v14

#endif // CHAINMETA_MODERN_V14_H
