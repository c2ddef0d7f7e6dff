#ifndef CHAINMETA_TYPE_REGISTRY_H
#define CHAINMETA_TYPE_REGISTRY_H

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "chainmeta/outcome.h"
#include "chainmeta/scale/scale.h"

namespace ChainMeta {

/**
 * @brief Handle into one TypeRegistry. Compact-encoded on the wire.
 *
 * Ids are meaningful only inside the registry that assigned them.
 * TypeId::unspecified() is never assigned by a builder; it marks slots whose
 * type was not recorded by the producer (see the V15 and V16 extrinsic and
 * outer enum slots).
 */
struct TypeId {
    uint32_t value = 0;

    static constexpr TypeId unspecified() { return TypeId{0xFFFFFFFFu}; }
    constexpr bool is_unspecified() const { return value == 0xFFFFFFFFu; }

    bool operator==(const TypeId&) const = default;
    auto operator<=>(const TypeId&) const = default;

    void scale_encode(scale::Writer& writer) const { writer.write_compact(value); }
    static TypeId scale_decode(scale::Reader& reader) { return TypeId{reader.read_compact_u32()}; }
};

// =============================================================================
// Type descriptors
// =============================================================================

enum class Primitive : uint8_t {
    Bool, Char, Str,
    U8, U16, U32, U64, U128, U256,
    I8, I16, I32, I64, I128, I256
};

const char* primitive_name(Primitive primitive);

struct Field {
    std::optional<std::string> name;
    TypeId ty;
    std::optional<std::string> type_name;
    std::vector<std::string> docs;

    bool operator==(const Field&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static Field scale_decode(scale::Reader& reader);
};

struct Variant {
    std::string name;
    std::vector<Field> fields;
    uint8_t index = 0;
    std::vector<std::string> docs;

    bool operator==(const Variant&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static Variant scale_decode(scale::Reader& reader);
};

/// Generic parameter binding, kept for display only.
struct TypeParameter {
    std::string name;
    std::optional<TypeId> ty;

    bool operator==(const TypeParameter&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static TypeParameter scale_decode(scale::Reader& reader);
};

struct TypeDefComposite {
    std::vector<Field> fields;
    bool operator==(const TypeDefComposite&) const = default;
};

struct TypeDefVariant {
    std::vector<Variant> variants;
    bool operator==(const TypeDefVariant&) const = default;
};

struct TypeDefSequence {
    TypeId element;
    bool operator==(const TypeDefSequence&) const = default;
};

struct TypeDefArray {
    uint32_t len = 0;
    TypeId element;
    bool operator==(const TypeDefArray&) const = default;
};

struct TypeDefTuple {
    std::vector<TypeId> elements;
    bool operator==(const TypeDefTuple&) const = default;
};

struct TypeDefPrimitive {
    Primitive primitive = Primitive::Bool;
    bool operator==(const TypeDefPrimitive&) const = default;
};

struct TypeDefCompact {
    TypeId inner;
    bool operator==(const TypeDefCompact&) const = default;
};

struct TypeDefBitSequence {
    TypeId bit_store;
    TypeId bit_order;
    bool operator==(const TypeDefBitSequence&) const = default;
};

// Alternative order is the wire discriminant
using TypeDef = std::variant<TypeDefComposite, TypeDefVariant, TypeDefSequence, TypeDefArray,
                             TypeDefTuple, TypeDefPrimitive, TypeDefCompact, TypeDefBitSequence>;

/**
 * @brief Structural description of one registered type.
 *
 * Children are referenced by TypeId, never owned, so recursive types are
 * plain entries that name each other.
 */
struct TypeDescriptor {
    std::vector<std::string> path;
    std::vector<TypeParameter> type_params;
    TypeDef def;
    std::vector<std::string> docs;

    bool operator==(const TypeDescriptor&) const = default;

    void scale_encode(scale::Writer& writer) const;
    static TypeDescriptor scale_decode(scale::Reader& reader);

    /// Calls visit(id, where) for every TypeId this descriptor refers to.
    void for_each_type_ref(const std::function<void(TypeId, std::string_view)>& visit) const;

    // ---- Convenience constructors ----
    static TypeDescriptor primitive(Primitive primitive);
    static TypeDescriptor composite(std::vector<std::string> path, std::vector<Field> fields);
    static TypeDescriptor variant(std::vector<std::string> path, std::vector<Variant> variants);
    static TypeDescriptor sequence(TypeId element);
    static TypeDescriptor array(uint32_t len, TypeId element);
    static TypeDescriptor tuple(std::vector<TypeId> elements);
    static TypeDescriptor compact(TypeId inner);
    static TypeDescriptor bit_sequence(TypeId bit_store, TypeId bit_order);
};

struct RegisteredType {
    TypeId id;
    TypeDescriptor type;

    bool operator==(const RegisteredType&) const = default;
    void scale_encode(scale::Writer& writer) const;
    static RegisteredType scale_decode(scale::Reader& reader);
};

// =============================================================================
// Registry
// =============================================================================

/**
 * @brief Flat, immutable table of type descriptors indexed by TypeId.
 *
 * Lookups are O(1) through a hash index and never throw. The registry does
 * not deduplicate: two structurally identical descriptors keep distinct ids.
 * Validation and display helpers walk the flat table and never follow
 * references recursively, so cyclic graphs are safe.
 */
class TypeRegistry {
public:
    TypeRegistry() = default;

    /// Fails with MalformedPayload on duplicate ids. Does not check closure.
    static Outcome<TypeRegistry> from_entries(std::vector<RegisteredType> entries);

    const TypeDescriptor* find(TypeId id) const;
    Outcome<const TypeDescriptor*> resolve(TypeId id) const;
    bool contains(TypeId id) const { return index_.contains(id.value); }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const std::vector<RegisteredType>& types() const { return entries_; }

    /**
     * @brief Closed-world check over the descriptors themselves.
     * @return DanglingTypeReference naming the first offending descriptor and field.
     */
    Outcome<void> validate() const;

    /**
     * @brief Checks one reference held by a schema tree.
     * @param allow_unspecified accept TypeId::unspecified() for optional slots
     */
    Outcome<void> check_reference(TypeId id, std::string_view where, bool allow_unspecified = false) const;

    /**
     * @brief Short display name such as `Vec<u8>`, `[u8; 32]` or `AccountId32`.
     *
     * Expansion stops after max_depth levels, and once the name reaches
     * kMaxDisplayNameLength characters. Unexpanded types print as `#id`.
     */
    std::string display_name(TypeId id, size_t max_depth = 4) const;

    static constexpr size_t kMaxDisplayNameLength = 256;

    void scale_encode(scale::Writer& writer) const;
    static TypeRegistry scale_decode(scale::Reader& reader);

    bool operator==(const TypeRegistry& other) const { return entries_ == other.entries_; }

private:
    void append_display_name(std::string& out, TypeId id, size_t max_depth) const;

    std::vector<RegisteredType> entries_;
    std::unordered_map<uint32_t, size_t> index_;
};

/**
 * @brief Assigns fresh ids in insertion order and produces a TypeRegistry.
 *
 * Self-referential types are built by reserving an id first, using it in the
 * descriptor, and defining it afterwards:
 * @code
 * TypeRegistryBuilder builder;
 * TypeId list = builder.reserve();
 * TypeId items = builder.add(TypeDescriptor::sequence(list));
 * builder.define(list, TypeDescriptor::composite({"List"}, {Field{"items", items}}));
 * auto registry = std::move(builder).build();
 * @endcode
 */
class TypeRegistryBuilder {
public:
    TypeId add(TypeDescriptor descriptor);
    TypeId reserve();
    Outcome<void> define(TypeId id, TypeDescriptor descriptor);

    size_t size() const { return slots_.size(); }

    /// Fails on reserved but undefined ids and on dangling references.
    Outcome<TypeRegistry> build() &&;

private:
    std::vector<std::optional<TypeDescriptor>> slots_;
};

} // namespace ChainMeta

#endif // CHAINMETA_TYPE_REGISTRY_H
