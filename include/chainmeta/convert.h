#ifndef CHAINMETA_CONVERT_H
#define CHAINMETA_CONVERT_H

#include <cstdint>

#include "chainmeta/metadata.h"
#include "chainmeta/outcome.h"

/**
 * @file convert.h
 * @brief One-way upgrades between neighbouring schema versions
 *
 * Every upgrade copies each source field into exactly one destination field.
 * Fields that only exist in the destination take these defaults:
 *
 * | step      | new field                         | default                                   |
 * |-----------|-----------------------------------|-------------------------------------------|
 * | V10 > V11 | extrinsic                         | version 0, no signed extensions           |
 * | V11 > V12 | module index                      | position in the module list               |
 * | V14 > V15 | pallet docs, apis, custom         | empty                                     |
 * | V14 > V15 | extrinsic address/call/sig/extra  | generic parameter of the extrinsic type with that name, else unspecified |
 * | V14 > V15 | outer enums                       | call enum = call type, event and error unspecified |
 * | V15 > V16 | deprecation info                  | not deprecated                            |
 * | V15 > V16 | associated types, view functions  | empty                                     |
 * | V15 > V16 | extrinsic versions / by_version   | [version] / version -> every extension    |
 * | V15 > V16 | runtime API version               | 0                                         |
 *
 * V16 has no slot for the V15 runtime type id or extrinsic extra type, so that
 * step is lossy and convert_to only takes it under ConversionPolicy::AllowLossy.
 * There is no path from the string-typed versions (V13 and older) to the
 * registry-backed ones, and none towards older versions.
 */

namespace ChainMeta {

enum class ConversionPolicy {
    Lossless,   // refuse steps that drop source fields
    AllowLossy  // accept the documented drops of the V15 to V16 step
};

Outcome<v9::RuntimeMetadataV9> upgrade(const v8::RuntimeMetadataV8& metadata);
Outcome<v10::RuntimeMetadataV10> upgrade(const v9::RuntimeMetadataV9& metadata);
Outcome<v11::RuntimeMetadataV11> upgrade(const v10::RuntimeMetadataV10& metadata);
Outcome<v12::RuntimeMetadataV12> upgrade(const v11::RuntimeMetadataV11& metadata);
Outcome<v13::RuntimeMetadataV13> upgrade(const v12::RuntimeMetadataV12& metadata);

Outcome<v15::RuntimeMetadataV15> upgrade(const v14::RuntimeMetadataV14& metadata);

/// Drops the V15 `ty` and `extrinsic.extra_ty` references; both types stay in the registry.
Outcome<v16::RuntimeMetadataV16> upgrade(const v15::RuntimeMetadataV15& metadata);

/**
 * @brief Upgrades step by step until the target version is reached.
 *
 * Errors: UnsupportedDowngrade when target is older than the source,
 * UnsupportedVersion when target is not compiled in, UnsupportedConversion
 * when no path exists or a lossy step is refused by the policy.
 */
Outcome<RuntimeMetadataPrefixed> convert_to(const RuntimeMetadataPrefixed& prefixed, uint8_t target,
                                            ConversionPolicy policy = ConversionPolicy::Lossless);

} // namespace ChainMeta

#endif // CHAINMETA_CONVERT_H
