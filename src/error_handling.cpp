#include "chainmeta/error_handling.h"

#include "chainmeta/logger.h"

namespace ChainMeta {

const char* error_kind_name(MetadataErrorKind kind) {
    switch (kind) {
        case MetadataErrorKind::BadMagic: return "BadMagic";
        case MetadataErrorKind::UnsupportedVersion: return "UnsupportedVersion";
        case MetadataErrorKind::MalformedPayload: return "MalformedPayload";
        case MetadataErrorKind::DanglingTypeReference: return "DanglingTypeReference";
        case MetadataErrorKind::UnsupportedDowngrade: return "UnsupportedDowngrade";
        case MetadataErrorKind::UnsupportedConversion: return "UnsupportedConversion";
    }
    return "Unknown";
}

std::string MetadataError::to_string() const {
    std::string out = error_kind_name(kind);
    if (version) {
        out += detail::format(" (V%u)", static_cast<unsigned>(*version));
    }
    out += ": ";
    out += message;
    if (!field_path.empty()) {
        out += " at ";
        out += field_path;
    }
    if (offset) {
        out += detail::format(" [offset %zu]", *offset);
    }
    return out;
}

MetadataError MetadataError::bad_magic(uint32_t found, std::source_location loc) {
    return MetadataError(MetadataErrorKind::BadMagic,
                         detail::format("expected magic 0x%08x, found 0x%08x", 0x6174656du, found),
                         loc);
}

MetadataError MetadataError::unsupported_version(uint8_t tag, std::source_location loc) {
    MetadataError err(MetadataErrorKind::UnsupportedVersion,
                      detail::format("metadata version %u is not supported", static_cast<unsigned>(tag)),
                      loc);
    err.version = tag;
    return err;
}

MetadataError MetadataError::malformed(std::string msg, std::source_location loc) {
    return MetadataError(MetadataErrorKind::MalformedPayload, std::move(msg), loc);
}

MetadataError MetadataError::dangling(uint32_t id, std::string where, std::source_location loc) {
    MetadataError err(MetadataErrorKind::DanglingTypeReference,
                      detail::format("type id %u is not in the registry", id), loc);
    err.type_id = id;
    err.field_path = std::move(where);
    return err;
}

MetadataError MetadataError::unsupported_downgrade(uint8_t from, uint8_t to, std::source_location loc) {
    MetadataError err(MetadataErrorKind::UnsupportedDowngrade,
                      detail::format("cannot convert V%u metadata down to V%u",
                                     static_cast<unsigned>(from), static_cast<unsigned>(to)),
                      loc);
    err.version = from;
    return err;
}

MetadataError MetadataError::unsupported_conversion(uint8_t from, uint8_t to, std::string reason,
                                                    std::source_location loc) {
    MetadataError err(MetadataErrorKind::UnsupportedConversion,
                      detail::format("cannot convert V%u metadata to V%u: %s",
                                     static_cast<unsigned>(from), static_cast<unsigned>(to), reason.c_str()),
                      loc);
    err.version = from;
    return err;
}

} // namespace ChainMeta
