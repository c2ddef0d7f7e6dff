#ifndef CHAINMETA_MODERN_V16_H
#define CHAINMETA_MODERN_V16_H

#include <array>
#include <map>

#include "chainmeta/modern/common.h"

namespace ChainMeta::v16 {

using modern::CustomMetadata;
using modern::CustomValueMetadata;
using modern::OuterEnums;
using modern::RuntimeApiMethodParamMetadata;

// =============================================================================
// Deprecation
// =============================================================================

/**
 * @brief Deprecation state of a single item.
 *
 * note and since are only meaningful for Kind::Deprecated. Encoding any
 * other kind with either set throws scale::EncodeError.
 */
struct DeprecationStatus {
    enum class Kind : uint8_t {
        NotDeprecated,
        DeprecatedWithoutNote,
        Deprecated
    };

    Kind kind = Kind::NotDeprecated;
    std::string note;
    std::optional<std::string> since;

    static DeprecationStatus not_deprecated() { return DeprecationStatus{}; }
    static DeprecationStatus without_note() { return DeprecationStatus{Kind::DeprecatedWithoutNote, {}, {}}; }
    static DeprecationStatus deprecated(std::string note, std::optional<std::string> since = std::nullopt) {
        return DeprecationStatus{Kind::Deprecated, std::move(note), std::move(since)};
    }

    bool operator==(const DeprecationStatus&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static DeprecationStatus scale_decode(scale::Reader& reader);
};

/**
 * @brief Deprecation state of a call, event or error enum.
 *
 * Either the whole enum is deprecated (item) or only some of its variants,
 * keyed by variant index. The payload of the other kinds must stay at its
 * default, otherwise encoding throws scale::EncodeError.
 */
struct DeprecationInfo {
    enum class Kind : uint8_t {
        NotDeprecated,
        ItemDeprecated,
        VariantsDeprecated
    };

    Kind kind = Kind::NotDeprecated;
    DeprecationStatus item;
    std::map<uint8_t, DeprecationStatus> variants;

    bool operator==(const DeprecationInfo&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static DeprecationInfo scale_decode(scale::Reader& reader);
};

// =============================================================================
// Pallets
// =============================================================================

struct StorageEntryMetadata {
    std::string name;
    StorageEntryModifier modifier = StorageEntryModifier::Optional;
    modern::StorageEntryType ty;
    std::vector<uint8_t> default_value;
    std::vector<std::string> docs;
    DeprecationStatus deprecation_info;

    bool operator==(const StorageEntryMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static StorageEntryMetadata scale_decode(scale::Reader& reader);
};

struct PalletStorageMetadata {
    std::string prefix;
    std::vector<StorageEntryMetadata> entries;

    bool operator==(const PalletStorageMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static PalletStorageMetadata scale_decode(scale::Reader& reader);
};

struct PalletCallMetadata {
    TypeId ty;
    DeprecationInfo deprecation_info;

    bool operator==(const PalletCallMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static PalletCallMetadata scale_decode(scale::Reader& reader);
};

struct PalletEventMetadata {
    TypeId ty;
    DeprecationInfo deprecation_info;

    bool operator==(const PalletEventMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static PalletEventMetadata scale_decode(scale::Reader& reader);
};

struct PalletErrorMetadata {
    TypeId ty;
    DeprecationInfo deprecation_info;

    bool operator==(const PalletErrorMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static PalletErrorMetadata scale_decode(scale::Reader& reader);
};

struct PalletConstantMetadata {
    std::string name;
    TypeId ty;
    std::vector<uint8_t> value;
    std::vector<std::string> docs;
    DeprecationStatus deprecation_info;

    bool operator==(const PalletConstantMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static PalletConstantMetadata scale_decode(scale::Reader& reader);
};

/// Type a pallet declares for its users, e.g. `Balance`.
struct PalletAssociatedTypeMetadata {
    std::string name;
    TypeId ty;
    std::vector<std::string> docs;

    bool operator==(const PalletAssociatedTypeMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static PalletAssociatedTypeMetadata scale_decode(scale::Reader& reader);
};

/// Read-only query a pallet exposes, addressed by a 32-byte id.
struct PalletViewFunctionMetadata {
    std::string name;
    std::array<uint8_t, 32> id{};
    std::vector<RuntimeApiMethodParamMetadata> inputs;
    TypeId output;
    std::vector<std::string> docs;
    DeprecationStatus deprecation_info;

    bool operator==(const PalletViewFunctionMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static PalletViewFunctionMetadata scale_decode(scale::Reader& reader);
};

struct PalletMetadata {
    std::string name;
    std::optional<PalletStorageMetadata> storage;
    std::optional<PalletCallMetadata> calls;
    std::optional<PalletEventMetadata> event;
    std::vector<PalletConstantMetadata> constants;
    std::optional<PalletErrorMetadata> error;
    std::vector<PalletAssociatedTypeMetadata> associated_types;
    std::vector<PalletViewFunctionMetadata> view_functions;
    uint8_t index = 0;
    std::vector<std::string> docs;
    DeprecationStatus deprecation_info;

    bool operator==(const PalletMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static PalletMetadata scale_decode(scale::Reader& reader);
};

// =============================================================================
// Extrinsic
// =============================================================================

struct TransactionExtensionMetadata {
    std::string identifier;
    TypeId ty;
    TypeId implicit;

    bool operator==(const TransactionExtensionMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static TransactionExtensionMetadata scale_decode(scale::Reader& reader);
};

/**
 * @brief Extrinsic formats the runtime accepts.
 *
 * transaction_extensions_by_version maps each extension version to indices
 * into transaction_extensions, in the order they apply.
 */
struct ExtrinsicMetadata {
    std::vector<uint8_t> versions;
    TypeId address_ty = TypeId::unspecified();
    TypeId signature_ty = TypeId::unspecified();
    std::map<uint8_t, std::vector<scale::Compact<uint32_t>>> transaction_extensions_by_version;
    std::vector<TransactionExtensionMetadata> transaction_extensions;

    bool operator==(const ExtrinsicMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static ExtrinsicMetadata scale_decode(scale::Reader& reader);
};

// =============================================================================
// Runtime APIs
// =============================================================================

struct RuntimeApiMethodMetadata {
    std::string name;
    std::vector<RuntimeApiMethodParamMetadata> inputs;
    TypeId output;
    std::vector<std::string> docs;
    DeprecationStatus deprecation_info;

    bool operator==(const RuntimeApiMethodMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static RuntimeApiMethodMetadata scale_decode(scale::Reader& reader);
};

struct RuntimeApiMetadata {
    std::string name;
    std::vector<RuntimeApiMethodMetadata> methods;
    std::vector<std::string> docs;
    DeprecationStatus deprecation_info;
    uint32_t version = 0;  // compact on the wire

    bool operator==(const RuntimeApiMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static RuntimeApiMetadata scale_decode(scale::Reader& reader);
};

/**
 * @brief Current schema.
 *
 * Wire order: types, pallets, extrinsic, apis, outer_enums, custom.
 */
struct RuntimeMetadataV16 {
    static constexpr uint8_t kVersion = 16;

    TypeRegistry types;
    std::vector<PalletMetadata> pallets;
    ExtrinsicMetadata extrinsic;
    std::vector<RuntimeApiMetadata> apis;
    OuterEnums outer_enums;
    CustomMetadata custom;

    bool operator==(const RuntimeMetadataV16&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static RuntimeMetadataV16 scale_decode(scale::Reader& reader);

    void for_each_type_ref(const modern::TypeRefVisitor& visit) const;

    /**
     * @brief Closed-world check, plus the extension index table.
     *
     * Every index in transaction_extensions_by_version must point into
     * transaction_extensions (MalformedPayload otherwise).
     */
    Outcome<void> validate() const;
};

} // namespace ChainMeta::v16

#endif // CHAINMETA_MODERN_V16_H
