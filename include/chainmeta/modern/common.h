#ifndef CHAINMETA_MODERN_COMMON_H
#define CHAINMETA_MODERN_COMMON_H

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "chainmeta/outcome.h"
#include "chainmeta/storage.h"
#include "chainmeta/type_registry.h"

namespace ChainMeta::modern {

/**
 * @brief Receives every TypeId a schema tree refers to.
 * @param id the reference
 * @param where dotted path of the referring field
 * @param may_be_unspecified the slot accepts TypeId::unspecified()
 */
using TypeRefVisitor = std::function<void(TypeId id, const std::string& where, bool may_be_unspecified)>;

/// Runs the closed-world check of a registry-backed tree.
template<typename Tree>
Outcome<void> check_type_refs(const Tree& tree, const TypeRegistry& registry) {
    auto closed = registry.validate();
    if (closed.is_err()) {
        return closed;
    }
    std::optional<MetadataError> failure;
    tree.for_each_type_ref([&](TypeId id, const std::string& where, bool may_be_unspecified) {
        if (failure) {
            return;
        }
        auto checked = registry.check_reference(id, where, may_be_unspecified);
        if (checked.is_err()) {
            failure = std::move(checked).error();
        }
    });
    if (failure) {
        failure->version = Tree::kVersion;
        return std::move(*failure);
    }
    return Ok();
}

// =============================================================================
// Pallet items shared by V14 and V15
// =============================================================================

/// Calls, events and errors are each described by one variant type.
struct PalletCallMetadata {
    TypeId ty;
    bool operator==(const PalletCallMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const { scale::encode(writer, ty); }
    static PalletCallMetadata scale_decode(scale::Reader& reader) {
        return PalletCallMetadata{scale::decode_field<TypeId>(reader, "ty")};
    }
};

struct PalletEventMetadata {
    TypeId ty;
    bool operator==(const PalletEventMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const { scale::encode(writer, ty); }
    static PalletEventMetadata scale_decode(scale::Reader& reader) {
        return PalletEventMetadata{scale::decode_field<TypeId>(reader, "ty")};
    }
};

struct PalletErrorMetadata {
    TypeId ty;
    bool operator==(const PalletErrorMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const { scale::encode(writer, ty); }
    static PalletErrorMetadata scale_decode(scale::Reader& reader) {
        return PalletErrorMetadata{scale::decode_field<TypeId>(reader, "ty")};
    }
};

struct PalletConstantMetadata {
    std::string name;
    TypeId ty;
    std::vector<uint8_t> value;
    std::vector<std::string> docs;

    bool operator==(const PalletConstantMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static PalletConstantMetadata scale_decode(scale::Reader& reader);
};

// =============================================================================
// Storage
// =============================================================================

struct PlainStorageType {
    TypeId value;
    bool operator==(const PlainStorageType&) const = default;
};

struct StorageKeyType {
    StorageHasher hasher = StorageHasher::Blake2_128;
    TypeId key;
    bool operator==(const StorageKeyType&) const = default;
};

/**
 * @brief Keyed storage with one hasher per key.
 *
 * With a single hasher, key is the key type itself. With N hashers, key is
 * a tuple of N members and hasher i applies to member i.
 */
struct MapStorageType {
    std::vector<StorageHasher> hashers;
    TypeId key;
    TypeId value;

    bool operator==(const MapStorageType&) const = default;

    /// Ordered (hasher, key type) pairs; fails if the key does not match the hasher count.
    Outcome<std::vector<StorageKeyType>> keys(const TypeRegistry& registry) const;
};

using StorageEntryType = std::variant<PlainStorageType, MapStorageType>;

void encode_storage_entry_type(scale::Writer& writer, const StorageEntryType& ty);
StorageEntryType decode_storage_entry_type(scale::Reader& reader);

struct StorageEntryMetadata {
    std::string name;
    StorageEntryModifier modifier = StorageEntryModifier::Optional;
    StorageEntryType ty;
    std::vector<uint8_t> default_value;
    std::vector<std::string> docs;

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

/// Reports the type references of one storage entry type.
void visit_storage_type_refs(const StorageEntryType& ty, const std::string& where,
                             const TypeRefVisitor& visit);

// =============================================================================
// Extension slots
// =============================================================================

/// Signed extension of the V14 and V15 extrinsic format.
struct SignedExtensionMetadata {
    std::string identifier;
    TypeId ty;
    TypeId additional_signed;

    bool operator==(const SignedExtensionMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static SignedExtensionMetadata scale_decode(scale::Reader& reader);
};

struct RuntimeApiMethodParamMetadata {
    std::string name;
    TypeId ty;

    bool operator==(const RuntimeApiMethodParamMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static RuntimeApiMethodParamMetadata scale_decode(scale::Reader& reader);
};

/**
 * @brief Types of the enums spanning every pallet's calls, events and errors.
 *
 * Any slot may hold TypeId::unspecified() when it was not recorded, which is
 * the case for upgraded V14 metadata.
 */
struct OuterEnums {
    TypeId call_enum_ty = TypeId::unspecified();
    TypeId event_enum_ty = TypeId::unspecified();
    TypeId error_enum_ty = TypeId::unspecified();

    bool operator==(const OuterEnums&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static OuterEnums scale_decode(scale::Reader& reader);
};

struct CustomValueMetadata {
    TypeId ty;
    std::vector<uint8_t> value;

    bool operator==(const CustomValueMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static CustomValueMetadata scale_decode(scale::Reader& reader);
};

/// Named, typed values producers attach without a version bump. Keys are kept sorted.
struct CustomMetadata {
    std::map<std::string, CustomValueMetadata> map;

    bool operator==(const CustomMetadata&) const = default;
    void scale_encode(scale::Writer& writer) const { scale::encode(writer, map); }
    static CustomMetadata scale_decode(scale::Reader& reader) {
        return CustomMetadata{scale::decode_field<std::map<std::string, CustomValueMetadata>>(reader, "map")};
    }
};

void visit_outer_enum_refs(const OuterEnums& outer, const TypeRefVisitor& visit);
void visit_custom_refs(const CustomMetadata& custom, const TypeRefVisitor& visit);

} // namespace ChainMeta::modern

#endif // CHAINMETA_MODERN_COMMON_H
