#include "chainmeta/type_registry.h"

#include "chainmeta/internal/debug.h"
#include "chainmeta/logger.h"

namespace ChainMeta {

const char* primitive_name(Primitive primitive) {
    switch (primitive) {
        case Primitive::Bool: return "bool";
        case Primitive::Char: return "char";
        case Primitive::Str: return "str";
        case Primitive::U8: return "u8";
        case Primitive::U16: return "u16";
        case Primitive::U32: return "u32";
        case Primitive::U64: return "u64";
        case Primitive::U128: return "u128";
        case Primitive::U256: return "U256";
        case Primitive::I8: return "i8";
        case Primitive::I16: return "i16";
        case Primitive::I32: return "i32";
        case Primitive::I64: return "i64";
        case Primitive::I128: return "i128";
        case Primitive::I256: return "I256";
    }
    return "?";
}

// =============================================================================
// Wire form
// =============================================================================

void Field::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, name);
    scale::encode(writer, ty);
    scale::encode(writer, type_name);
    scale::encode(writer, docs);
}

Field Field::scale_decode(scale::Reader& reader) {
    Field field;
    field.name = scale::decode_field<std::optional<std::string>>(reader, "name");
    field.ty = scale::decode_field<TypeId>(reader, "ty");
    field.type_name = scale::decode_field<std::optional<std::string>>(reader, "type_name");
    field.docs = scale::decode_field<std::vector<std::string>>(reader, "docs");
    return field;
}

void Variant::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, name);
    scale::encode(writer, fields);
    writer.write_u8(index);
    scale::encode(writer, docs);
}

Variant Variant::scale_decode(scale::Reader& reader) {
    Variant variant;
    variant.name = scale::decode_field<std::string>(reader, "name");
    variant.fields = scale::decode_field<std::vector<Field>>(reader, "fields");
    variant.index = scale::decode_field<uint8_t>(reader, "index");
    variant.docs = scale::decode_field<std::vector<std::string>>(reader, "docs");
    return variant;
}

void TypeParameter::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, name);
    scale::encode(writer, ty);
}

TypeParameter TypeParameter::scale_decode(scale::Reader& reader) {
    TypeParameter param;
    param.name = scale::decode_field<std::string>(reader, "name");
    param.ty = scale::decode_field<std::optional<TypeId>>(reader, "ty");
    return param;
}

namespace {

void encode_def(scale::Writer& writer, const TypeDef& def) {
    writer.write_u8(static_cast<uint8_t>(def.index()));
    std::visit([&writer](const auto& d) {
        using D = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<D, TypeDefComposite>) {
            scale::encode(writer, d.fields);
        } else if constexpr (std::is_same_v<D, TypeDefVariant>) {
            scale::encode(writer, d.variants);
        } else if constexpr (std::is_same_v<D, TypeDefSequence>) {
            scale::encode(writer, d.element);
        } else if constexpr (std::is_same_v<D, TypeDefArray>) {
            writer.write_u32_le(d.len);
            scale::encode(writer, d.element);
        } else if constexpr (std::is_same_v<D, TypeDefTuple>) {
            scale::encode(writer, d.elements);
        } else if constexpr (std::is_same_v<D, TypeDefPrimitive>) {
            writer.write_u8(static_cast<uint8_t>(d.primitive));
        } else if constexpr (std::is_same_v<D, TypeDefCompact>) {
            scale::encode(writer, d.inner);
        } else {
            scale::encode(writer, d.bit_store);
            scale::encode(writer, d.bit_order);
        }
    }, def);
}

TypeDef decode_def(scale::Reader& reader) {
    switch (reader.read_tag("TypeDef", 7)) {
        case 0:
            return TypeDefComposite{scale::decode_field<std::vector<Field>>(reader, "fields")};
        case 1:
            return TypeDefVariant{scale::decode_field<std::vector<Variant>>(reader, "variants")};
        case 2:
            return TypeDefSequence{scale::decode_field<TypeId>(reader, "type_param")};
        case 3: {
            TypeDefArray array;
            array.len = scale::decode_field<uint32_t>(reader, "len");
            array.element = scale::decode_field<TypeId>(reader, "type_param");
            return array;
        }
        case 4:
            return TypeDefTuple{scale::decode_field<std::vector<TypeId>>(reader, "fields")};
        case 5:
            return TypeDefPrimitive{static_cast<Primitive>(reader.read_tag("Primitive", 14))};
        case 6:
            return TypeDefCompact{scale::decode_field<TypeId>(reader, "type_param")};
        default: {
            TypeDefBitSequence bits;
            bits.bit_store = scale::decode_field<TypeId>(reader, "bit_store_type");
            bits.bit_order = scale::decode_field<TypeId>(reader, "bit_order_type");
            return bits;
        }
    }
}

} // namespace

void TypeDescriptor::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, path);
    scale::encode(writer, type_params);
    encode_def(writer, def);
    scale::encode(writer, docs);
}

TypeDescriptor TypeDescriptor::scale_decode(scale::Reader& reader) {
    TypeDescriptor type;
    type.path = scale::decode_field<std::vector<std::string>>(reader, "path");
    type.type_params = scale::decode_field<std::vector<TypeParameter>>(reader, "type_params");
    {
        scale::FieldScope scope(reader, "type_def");
        type.def = decode_def(reader);
    }
    type.docs = scale::decode_field<std::vector<std::string>>(reader, "docs");
    return type;
}

void RegisteredType::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, id);
    scale::encode(writer, type);
}

RegisteredType RegisteredType::scale_decode(scale::Reader& reader) {
    RegisteredType entry;
    entry.id = scale::decode_field<TypeId>(reader, "id");
    entry.type = scale::decode_field<TypeDescriptor>(reader, "type");
    CMETA_VERBOSE("type %u decoded, next entry at offset %zu", entry.id.value, reader.offset());
    return entry;
}

void TypeDescriptor::for_each_type_ref(const std::function<void(TypeId, std::string_view)>& visit) const {
    for (const auto& param : type_params) {
        if (param.ty) {
            visit(*param.ty, "type_params");
        }
    }
    std::visit([&visit](const auto& d) {
        using D = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<D, TypeDefComposite>) {
            for (const auto& field : d.fields) visit(field.ty, "fields");
        } else if constexpr (std::is_same_v<D, TypeDefVariant>) {
            for (const auto& variant : d.variants) {
                for (const auto& field : variant.fields) visit(field.ty, "variants.fields");
            }
        } else if constexpr (std::is_same_v<D, TypeDefSequence> || std::is_same_v<D, TypeDefArray>) {
            visit(d.element, "type_param");
        } else if constexpr (std::is_same_v<D, TypeDefTuple>) {
            for (const auto& element : d.elements) visit(element, "fields");
        } else if constexpr (std::is_same_v<D, TypeDefCompact>) {
            visit(d.inner, "type_param");
        } else if constexpr (std::is_same_v<D, TypeDefBitSequence>) {
            visit(d.bit_store, "bit_store_type");
            visit(d.bit_order, "bit_order_type");
        }
    }, def);
}

// =============================================================================
// Convenience constructors
// =============================================================================

TypeDescriptor TypeDescriptor::primitive(Primitive primitive) {
    TypeDescriptor type;
    type.def = TypeDefPrimitive{primitive};
    return type;
}

TypeDescriptor TypeDescriptor::composite(std::vector<std::string> path, std::vector<Field> fields) {
    TypeDescriptor type;
    type.path = std::move(path);
    type.def = TypeDefComposite{std::move(fields)};
    return type;
}

TypeDescriptor TypeDescriptor::variant(std::vector<std::string> path, std::vector<Variant> variants) {
    TypeDescriptor type;
    type.path = std::move(path);
    type.def = TypeDefVariant{std::move(variants)};
    return type;
}

TypeDescriptor TypeDescriptor::sequence(TypeId element) {
    TypeDescriptor type;
    type.def = TypeDefSequence{element};
    return type;
}

TypeDescriptor TypeDescriptor::array(uint32_t len, TypeId element) {
    TypeDescriptor type;
    type.def = TypeDefArray{len, element};
    return type;
}

TypeDescriptor TypeDescriptor::tuple(std::vector<TypeId> elements) {
    TypeDescriptor type;
    type.def = TypeDefTuple{std::move(elements)};
    return type;
}

TypeDescriptor TypeDescriptor::compact(TypeId inner) {
    TypeDescriptor type;
    type.def = TypeDefCompact{inner};
    return type;
}

TypeDescriptor TypeDescriptor::bit_sequence(TypeId bit_store, TypeId bit_order) {
    TypeDescriptor type;
    type.def = TypeDefBitSequence{bit_store, bit_order};
    return type;
}

// =============================================================================
// TypeRegistry
// =============================================================================

Outcome<TypeRegistry> TypeRegistry::from_entries(std::vector<RegisteredType> entries) {
    TypeRegistry registry;
    registry.index_.reserve(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        auto [it, inserted] = registry.index_.emplace(entries[i].id.value, i);
        if (!inserted) {
            MetadataError err = MetadataError::malformed(
                detail::format("type id %u appears more than once", entries[i].id.value));
            err.type_id = entries[i].id.value;
            return err;
        }
    }
    registry.entries_ = std::move(entries);
    return Ok(std::move(registry));
}

const TypeDescriptor* TypeRegistry::find(TypeId id) const {
    auto it = index_.find(id.value);
    if (it == index_.end()) {
        return nullptr;
    }
    return &entries_[it->second].type;
}

Outcome<const TypeDescriptor*> TypeRegistry::resolve(TypeId id) const {
    const TypeDescriptor* type = find(id);
    if (type == nullptr) {
        return MetadataError::dangling(id.value, "");
    }
    return Outcome<const TypeDescriptor*>::Ok(type);
}

Outcome<void> TypeRegistry::check_reference(TypeId id, std::string_view where, bool allow_unspecified) const {
    if (allow_unspecified && id.is_unspecified()) {
        return Ok();
    }
    if (!contains(id)) {
        return MetadataError::dangling(id.value, std::string(where));
    }
    return Ok();
}

Outcome<void> TypeRegistry::validate() const {
    for (const auto& entry : entries_) {
        std::optional<MetadataError> failure;
        entry.type.for_each_type_ref([&](TypeId ref, std::string_view where) {
            if (!failure && !contains(ref)) {
                failure = MetadataError::dangling(
                    ref.value, detail::format("types[%u].%.*s", entry.id.value,
                                              static_cast<int>(where.size()), where.data()));
            }
        });
        if (failure) {
            CMETA_DEBUG("registry closure violated: %s", failure->to_string().c_str());
            return std::move(*failure);
        }
    }
    return Ok();
}

std::string TypeRegistry::display_name(TypeId id, size_t max_depth) const {
    std::string out;
    append_display_name(out, id, max_depth);
    return out;
}

void TypeRegistry::append_display_name(std::string& out, TypeId id, size_t max_depth) const {
    const TypeDescriptor* type = find(id);
    if (type == nullptr || max_depth == 0 || out.size() >= kMaxDisplayNameLength) {
        out += "#" + std::to_string(id.value);
        return;
    }
    const size_t next = max_depth - 1;
    std::visit([&](const auto& d) {
        using D = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<D, TypeDefPrimitive>) {
            out += primitive_name(d.primitive);
        } else if constexpr (std::is_same_v<D, TypeDefSequence>) {
            out += "Vec<";
            append_display_name(out, d.element, next);
            out += ">";
        } else if constexpr (std::is_same_v<D, TypeDefArray>) {
            out += "[";
            append_display_name(out, d.element, next);
            out += "; " + std::to_string(d.len) + "]";
        } else if constexpr (std::is_same_v<D, TypeDefTuple>) {
            out += "(";
            for (size_t i = 0; i < d.elements.size(); ++i) {
                if (i != 0) out += ", ";
                append_display_name(out, d.elements[i], next);
            }
            out += ")";
        } else if constexpr (std::is_same_v<D, TypeDefCompact>) {
            out += "Compact<";
            append_display_name(out, d.inner, next);
            out += ">";
        } else if constexpr (std::is_same_v<D, TypeDefBitSequence>) {
            out += "BitVec<";
            append_display_name(out, d.bit_order, next);
            out += ", ";
            append_display_name(out, d.bit_store, next);
            out += ">";
        } else if (type->path.empty()) {
            out += "#" + std::to_string(id.value);
        } else {
            out += type->path.back();
        }
    }, type->def);
}

void TypeRegistry::scale_encode(scale::Writer& writer) const {
    scale::encode(writer, entries_);
}

TypeRegistry TypeRegistry::scale_decode(scale::Reader& reader) {
    auto entries = scale::decode<std::vector<RegisteredType>>(reader);
    auto registry = from_entries(std::move(entries));
    if (registry.is_err()) {
        reader.fail(registry.error().message);
    }
    return std::move(registry).value();
}

// =============================================================================
// TypeRegistryBuilder
// =============================================================================

TypeId TypeRegistryBuilder::add(TypeDescriptor descriptor) {
    TypeId id{static_cast<uint32_t>(slots_.size())};
    slots_.emplace_back(std::move(descriptor));
    return id;
}

TypeId TypeRegistryBuilder::reserve() {
    TypeId id{static_cast<uint32_t>(slots_.size())};
    slots_.emplace_back(std::nullopt);
    return id;
}

Outcome<void> TypeRegistryBuilder::define(TypeId id, TypeDescriptor descriptor) {
    if (id.value >= slots_.size()) {
        return MetadataError::dangling(id.value, "define");
    }
    if (slots_[id.value].has_value()) {
        MetadataError err = MetadataError::malformed(
            detail::format("type id %u is already defined", id.value));
        err.type_id = id.value;
        return err;
    }
    slots_[id.value] = std::move(descriptor);
    return Ok();
}

Outcome<TypeRegistry> TypeRegistryBuilder::build() && {
    std::vector<RegisteredType> entries;
    entries.reserve(slots_.size());
    for (size_t i = 0; i < slots_.size(); ++i) {
        if (!slots_[i]) {
            return MetadataError::dangling(static_cast<uint32_t>(i), "reserved but never defined");
        }
        entries.push_back(RegisteredType{TypeId{static_cast<uint32_t>(i)}, std::move(*slots_[i])});
    }
    slots_.clear();

    auto registry = TypeRegistry::from_entries(std::move(entries));
    if (registry.is_err()) {
        return std::move(registry).error();
    }
    auto closed = registry.value().validate();
    if (closed.is_err()) {
        LOG_DEBUG("type registry build failed: " + closed.error().to_string());
        return std::move(closed).error();
    }
    return registry;
}

} // namespace ChainMeta
