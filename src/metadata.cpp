#include "chainmeta/metadata.h"

#include <optional>
#include <type_traits>

#include "chainmeta/internal/debug.h"
#include "chainmeta/logger.h"

namespace ChainMeta {

namespace {

constexpr size_t kHeaderSize = 5;

template<typename T>
concept RegistryBacked = requires(const T& t) {
    { t.types } -> std::convertible_to<const TypeRegistry&>;
    { t.validate() } -> std::same_as<Outcome<void>>;
};

/// Decodes the alternative whose kVersion equals tag. Returns false if none does.
template<size_t I = 0>
bool decode_alternative(uint8_t tag, scale::Reader& reader, std::optional<RuntimeMetadata>& out) {
    if constexpr (I < std::variant_size_v<RuntimeMetadata>) {
        using Alt = std::variant_alternative_t<I, RuntimeMetadata>;
        if (Alt::kVersion == tag) {
            out.emplace(std::in_place_index<I>, Alt::scale_decode(reader));
            return true;
        }
        return decode_alternative<I + 1>(tag, reader, out);
    } else {
        return false;
    }
}

template<size_t... I>
std::vector<uint8_t> collect_versions(std::index_sequence<I...>) {
    return {std::variant_alternative_t<I, RuntimeMetadata>::kVersion...};
}

Outcome<void> validate_tree(const RuntimeMetadata& metadata) {
    return std::visit([](const auto& tree) -> Outcome<void> {
        using T = std::decay_t<decltype(tree)>;
        if constexpr (RegistryBacked<T>) {
            return tree.validate();
        } else {
            return Ok();
        }
    }, metadata);
}

Outcome<void> check_header(std::span<const uint8_t> bytes) {
    if (bytes.size() < 4) {
        // A short prefix of the marker is a truncated envelope, anything else is not one at all
        uint32_t partial = 0;
        for (size_t i = 0; i < bytes.size(); ++i) {
            partial |= static_cast<uint32_t>(bytes[i]) << (8 * i);
        }
        uint32_t mask = bytes.empty() ? 0u : (0xFFFFFFFFu >> (8 * (4 - bytes.size())));
        if ((kMetadataMagic & mask) != partial) {
            return MetadataError::bad_magic(partial);
        }
        MetadataError err = MetadataError::malformed("input ends inside the magic marker");
        err.offset = bytes.size();
        return err;
    }
    uint32_t magic = static_cast<uint32_t>(bytes[0]) | (static_cast<uint32_t>(bytes[1]) << 8) |
                     (static_cast<uint32_t>(bytes[2]) << 16) | (static_cast<uint32_t>(bytes[3]) << 24);
    if (magic != kMetadataMagic) {
        return MetadataError::bad_magic(magic);
    }
    if (bytes.size() < kHeaderSize) {
        MetadataError err = MetadataError::malformed("input ends before the version tag");
        err.offset = 4;
        return err;
    }
    return Ok();
}

} // namespace

uint8_t version_of(const RuntimeMetadata& metadata) {
    return std::visit([](const auto& tree) -> uint8_t {
        return std::decay_t<decltype(tree)>::kVersion;
    }, metadata);
}

const TypeRegistry* RuntimeMetadataPrefixed::types() const {
    return std::visit([](const auto& tree) -> const TypeRegistry* {
        using T = std::decay_t<decltype(tree)>;
        if constexpr (RegistryBacked<T>) {
            return &tree.types;
        } else {
            return nullptr;
        }
    }, metadata);
}

std::vector<uint8_t> supported_versions() {
    return collect_versions(std::make_index_sequence<std::variant_size_v<RuntimeMetadata>>{});
}

bool is_supported_version(uint8_t tag) {
    for (uint8_t version : supported_versions()) {
        if (version == tag) {
            return true;
        }
    }
    return false;
}

Outcome<std::vector<uint8_t>> encode(const RuntimeMetadataPrefixed& prefixed) {
    const uint8_t version = prefixed.version();
    if (prefixed.magic != kMetadataMagic) {
        return MetadataError::bad_magic(prefixed.magic);
    }

    auto valid = validate_tree(prefixed.metadata);
    if (valid.is_err()) {
        MetadataError err = std::move(valid).error();
        err.version = version;
        LOG_DEBUG("refusing to encode: " + err.to_string());
        return err;
    }

    scale::Writer writer;
    writer.write_u32_le(prefixed.magic);
    writer.write_u8(version);
    try {
        std::visit([&writer](const auto& tree) { scale::encode(writer, tree); }, prefixed.metadata);
    } catch (const scale::EncodeError& e) {
        MetadataError err = MetadataError::malformed(e.what());
        err.version = version;
        LOG_DEBUG("encode failed: " + err.to_string());
        return err;
    }
    CMETA_DEBUG("encoded V%u metadata into %zu bytes", static_cast<unsigned>(version), writer.size());
    return Ok(writer.take_buffer());
}

Outcome<uint8_t> version_of(std::span<const uint8_t> bytes) {
    auto header = check_header(bytes);
    if (header.is_err()) {
        return std::move(header).error();
    }
    return Outcome<uint8_t>::Ok(bytes[4]);
}

Outcome<RuntimeMetadataPrefixed> decode(std::span<const uint8_t> bytes) {
    auto header = check_header(bytes);
    if (header.is_err()) {
        return std::move(header).error();
    }
    const uint8_t tag = bytes[4];
    if (!is_supported_version(tag)) {
        LOG_DEBUG_F("unsupported metadata version %u", static_cast<unsigned>(tag));
        return MetadataError::unsupported_version(tag);
    }

    LogStopwatch timer(detail::format("decode V%u", static_cast<unsigned>(tag)));
    scale::Reader reader(bytes);
    std::optional<RuntimeMetadata> metadata;
    try {
        reader.read_u32_le();
        reader.read_u8();
        if (!decode_alternative(tag, reader, metadata)) {
            return MetadataError::unsupported_version(tag);
        }
        reader.expect_end();
    } catch (const scale::DecodeError& e) {
        MetadataError err = MetadataError::malformed(e.reason());
        err.version = tag;
        err.offset = e.offset();
        err.field_path = e.path();
        LOG_DEBUG("decode failed: " + err.to_string());
        return err;
    }

    RuntimeMetadataPrefixed prefixed(std::move(*metadata));
    auto valid = validate_tree(prefixed.metadata);
    if (valid.is_err()) {
        MetadataError err = std::move(valid).error();
        err.version = tag;
        LOG_DEBUG("decoded metadata is not closed: " + err.to_string());
        return err;
    }
    return Ok(std::move(prefixed));
}

// =============================================================================
// Opaque form
// =============================================================================

Outcome<OpaqueMetadata> to_opaque(const RuntimeMetadataPrefixed& prefixed) {
    auto bytes = encode(prefixed);
    if (bytes.is_err()) {
        return std::move(bytes).error();
    }
    return Ok(OpaqueMetadata{std::move(bytes).value()});
}

Outcome<RuntimeMetadataPrefixed> from_opaque(const OpaqueMetadata& opaque) {
    return decode(opaque.bytes);
}

Outcome<RuntimeMetadataPrefixed> decode_opaque(std::span<const uint8_t> bytes) {
    OpaqueMetadata opaque;
    try {
        opaque = scale::from_bytes<OpaqueMetadata>(bytes);
    } catch (const scale::DecodeError& e) {
        MetadataError err = MetadataError::malformed(e.reason());
        err.offset = e.offset();
        return err;
    }
    return from_opaque(opaque);
}

} // namespace ChainMeta
