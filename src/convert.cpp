#include "chainmeta/convert.h"

#include <type_traits>

#include "chainmeta/logger.h"

namespace ChainMeta {

namespace {

// =============================================================================
// String-typed versions
// =============================================================================

template<uint8_t To, uint8_t From>
legacy::StorageMetadata<To> convert_storage(const legacy::StorageMetadata<From>& storage) {
    legacy::StorageMetadata<To> out;
    out.prefix = storage.prefix;
    out.entries.reserve(storage.entries.size());
    for (const auto& entry : storage.entries) {
        out.entries.push_back(legacy::StorageEntryMetadata<To>{
            entry.name, entry.modifier, entry.ty, entry.default_value, entry.documentation});
    }
    return out;
}

template<uint8_t To, uint8_t From>
Outcome<legacy::RuntimeMetadata<To>> upgrade_legacy(const legacy::RuntimeMetadata<From>& metadata) {
    static_assert(To == From + 1, "legacy upgrades go one version at a time");

    legacy::RuntimeMetadata<To> out;
    out.modules.reserve(metadata.modules.size());
    for (size_t position = 0; position < metadata.modules.size(); ++position) {
        const auto& module = metadata.modules[position];
        legacy::ModuleMetadata<To> converted;
        converted.name = module.name;
        if (module.storage) {
            converted.storage = convert_storage<To>(*module.storage);
        }
        converted.calls = module.calls;
        converted.event = module.event;
        converted.constants = module.constants;
        converted.errors = module.errors;
        if constexpr (To >= 12) {
            if constexpr (From >= 12) {
                converted.index = module.index;
            } else {
                if (position > 0xFF) {
                    return MetadataError::unsupported_conversion(
                        From, To, detail::format("module %zu has no u8 index", position));
                }
                converted.index = static_cast<uint8_t>(position);
            }
        }
        out.modules.push_back(std::move(converted));
    }

    if constexpr (To >= 11) {
        if constexpr (From >= 11) {
            out.extrinsic = metadata.extrinsic;
        } else {
            out.extrinsic = legacy::ExtrinsicMetadata{};
        }
    }
    return Ok(std::move(out));
}

// =============================================================================
// Registry-backed versions
// =============================================================================

/// Generic parameter of the V14 extrinsic type with this name, or unspecified.
TypeId extrinsic_part(const TypeDescriptor& extrinsic, std::string_view name) {
    for (const auto& param : extrinsic.type_params) {
        if (param.name == name && param.ty) {
            return *param.ty;
        }
    }
    return TypeId::unspecified();
}

v16::DeprecationInfo not_deprecated_enum() {
    return v16::DeprecationInfo{};
}

// =============================================================================
// Chaining
// =============================================================================

template<typename T, typename Variant>
struct is_alternative;

template<typename T, typename... Alts>
struct is_alternative<T, std::variant<Alts...>> : std::bool_constant<(std::is_same_v<T, Alts> || ...)> {};

template<typename T>
Outcome<RuntimeMetadata> climb(const T& tree, uint8_t target, ConversionPolicy policy) {
    if (T::kVersion == target) {
        if constexpr (is_alternative<T, RuntimeMetadata>::value) {
            return Ok(RuntimeMetadata(tree));
        } else {
            return MetadataError::unsupported_version(target);
        }
    }
    if constexpr (T::kVersion == 13 || T::kVersion == kCurrentVersion) {
        return MetadataError::unsupported_conversion(T::kVersion, target, "no upgrade path");
    } else {
        if constexpr (T::kVersion == 15) {
            if (policy == ConversionPolicy::Lossless) {
                return MetadataError::unsupported_conversion(
                    T::kVersion, target,
                    "V16 has no slot for the runtime type or the extrinsic extra type");
            }
            LOG_WARN("taking the lossy V15 to V16 step");
        }
        LOG_TRACE_F("upgrading V%u towards V%u", static_cast<unsigned>(T::kVersion),
                    static_cast<unsigned>(target));
        auto next = upgrade(tree);
        if (next.is_err()) {
            return std::move(next).error();
        }
        return climb(next.value(), target, policy);
    }
}

} // namespace

Outcome<v9::RuntimeMetadataV9> upgrade(const v8::RuntimeMetadataV8& metadata) {
    return upgrade_legacy<9>(metadata);
}

Outcome<v10::RuntimeMetadataV10> upgrade(const v9::RuntimeMetadataV9& metadata) {
    return upgrade_legacy<10>(metadata);
}

Outcome<v11::RuntimeMetadataV11> upgrade(const v10::RuntimeMetadataV10& metadata) {
    return upgrade_legacy<11>(metadata);
}

Outcome<v12::RuntimeMetadataV12> upgrade(const v11::RuntimeMetadataV11& metadata) {
    return upgrade_legacy<12>(metadata);
}

Outcome<v13::RuntimeMetadataV13> upgrade(const v12::RuntimeMetadataV12& metadata) {
    return upgrade_legacy<13>(metadata);
}

Outcome<v15::RuntimeMetadataV15> upgrade(const v14::RuntimeMetadataV14& metadata) {
    auto closed = metadata.validate();
    if (closed.is_err()) {
        return std::move(closed).error();
    }

    v15::RuntimeMetadataV15 out;
    out.types = metadata.types;
    out.pallets.reserve(metadata.pallets.size());
    for (const auto& pallet : metadata.pallets) {
        v15::PalletMetadata converted;
        converted.name = pallet.name;
        converted.storage = pallet.storage;
        converted.calls = pallet.calls;
        converted.event = pallet.event;
        converted.constants = pallet.constants;
        converted.error = pallet.error;
        converted.index = pallet.index;
        out.pallets.push_back(std::move(converted));
    }

    auto extrinsic = metadata.types.resolve(metadata.extrinsic.ty);
    if (extrinsic.is_err()) {
        return std::move(extrinsic).error();
    }
    out.extrinsic.version = metadata.extrinsic.version;
    out.extrinsic.address_ty = extrinsic_part(*extrinsic.value(), "Address");
    out.extrinsic.call_ty = extrinsic_part(*extrinsic.value(), "Call");
    out.extrinsic.signature_ty = extrinsic_part(*extrinsic.value(), "Signature");
    out.extrinsic.extra_ty = extrinsic_part(*extrinsic.value(), "Extra");
    out.extrinsic.signed_extensions = metadata.extrinsic.signed_extensions;
    if (out.extrinsic.call_ty.is_unspecified() || out.extrinsic.address_ty.is_unspecified()) {
        LOG_INFO_F("extrinsic type %u does not name all of its parts, leaving them unspecified",
                   metadata.extrinsic.ty.value);
    }

    out.ty = metadata.ty;
    out.outer_enums.call_enum_ty = out.extrinsic.call_ty;
    out.outer_enums.event_enum_ty = TypeId::unspecified();
    out.outer_enums.error_enum_ty = TypeId::unspecified();
    return Ok(std::move(out));
}

Outcome<v16::RuntimeMetadataV16> upgrade(const v15::RuntimeMetadataV15& metadata) {
    auto closed = metadata.validate();
    if (closed.is_err()) {
        return std::move(closed).error();
    }

    v16::RuntimeMetadataV16 out;
    out.types = metadata.types;
    out.pallets.reserve(metadata.pallets.size());
    for (const auto& pallet : metadata.pallets) {
        v16::PalletMetadata converted;
        converted.name = pallet.name;
        if (pallet.storage) {
            v16::PalletStorageMetadata storage;
            storage.prefix = pallet.storage->prefix;
            for (const auto& entry : pallet.storage->entries) {
                storage.entries.push_back(v16::StorageEntryMetadata{
                    entry.name, entry.modifier, entry.ty, entry.default_value, entry.docs,
                    v16::DeprecationStatus::not_deprecated()});
            }
            converted.storage = std::move(storage);
        }
        if (pallet.calls) {
            converted.calls = v16::PalletCallMetadata{pallet.calls->ty, not_deprecated_enum()};
        }
        if (pallet.event) {
            converted.event = v16::PalletEventMetadata{pallet.event->ty, not_deprecated_enum()};
        }
        for (const auto& constant : pallet.constants) {
            converted.constants.push_back(v16::PalletConstantMetadata{
                constant.name, constant.ty, constant.value, constant.docs,
                v16::DeprecationStatus::not_deprecated()});
        }
        if (pallet.error) {
            converted.error = v16::PalletErrorMetadata{pallet.error->ty, not_deprecated_enum()};
        }
        converted.index = pallet.index;
        converted.docs = pallet.docs;
        out.pallets.push_back(std::move(converted));
    }

    const auto& extrinsic = metadata.extrinsic;
    out.extrinsic.versions = {extrinsic.version};
    out.extrinsic.address_ty = extrinsic.address_ty;
    out.extrinsic.signature_ty = extrinsic.signature_ty;
    std::vector<scale::Compact<uint32_t>> indices;
    for (size_t i = 0; i < extrinsic.signed_extensions.size(); ++i) {
        const auto& extension = extrinsic.signed_extensions[i];
        out.extrinsic.transaction_extensions.push_back(v16::TransactionExtensionMetadata{
            extension.identifier, extension.ty, extension.additional_signed});
        indices.push_back(scale::Compact<uint32_t>{static_cast<uint32_t>(i)});
    }
    out.extrinsic.transaction_extensions_by_version.emplace(extrinsic.version, std::move(indices));

    for (const auto& api : metadata.apis) {
        v16::RuntimeApiMetadata converted;
        converted.name = api.name;
        converted.docs = api.docs;
        for (const auto& method : api.methods) {
            converted.methods.push_back(v16::RuntimeApiMethodMetadata{
                method.name, method.inputs, method.output, method.docs,
                v16::DeprecationStatus::not_deprecated()});
        }
        out.apis.push_back(std::move(converted));
    }

    out.outer_enums = metadata.outer_enums;
    out.custom = metadata.custom;

    LOG_INFO_F("V15 runtime type %u and extra type %u have no V16 slot and were dropped",
               metadata.ty.value, extrinsic.extra_ty.value);
    return Ok(std::move(out));
}

Outcome<RuntimeMetadataPrefixed> convert_to(const RuntimeMetadataPrefixed& prefixed, uint8_t target,
                                            ConversionPolicy policy) {
    const uint8_t source = prefixed.version();
    if (target < source) {
        return MetadataError::unsupported_downgrade(source, target);
    }
    if (!is_supported_version(target)) {
        return MetadataError::unsupported_version(target);
    }
    if (!is_modern_version(source) && is_modern_version(target)) {
        return MetadataError::unsupported_conversion(
            source, target, "string-typed metadata cannot be given a type registry");
    }
    if (target == source) {
        return Ok(RuntimeMetadataPrefixed(prefixed));
    }

    auto converted = std::visit([&](const auto& tree) {
        return climb(tree, target, policy);
    }, prefixed.metadata);
    if (converted.is_err()) {
        return std::move(converted).error();
    }
    LOG_DEBUG_F("converted metadata from V%u to V%u", static_cast<unsigned>(source),
                static_cast<unsigned>(target));
    return Ok(RuntimeMetadataPrefixed(std::move(converted).value()));
}

} // namespace ChainMeta
