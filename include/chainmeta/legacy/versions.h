#ifndef CHAINMETA_LEGACY_VERSIONS_H
#define CHAINMETA_LEGACY_VERSIONS_H

#include "chainmeta/legacy/metadata.h"

/**
 * @file versions.h
 * @brief Per-version names for the string-typed schemas
 *
 * V8 and V9 share a wire layout but are distinct types, as are all other
 * versions. Differences by version:
 * - V10 adds the Blake2_128Concat hasher
 * - V11 adds the Identity hasher and the top-level extrinsic descriptor
 * - V12 adds an explicit module index
 * - V13 adds the NMap storage shape
 */

namespace ChainMeta::v8 {
using legacy::FunctionArgumentMetadata;
using legacy::FunctionMetadata;
using legacy::EventMetadata;
using legacy::ModuleConstantMetadata;
using legacy::ErrorMetadata;
using StorageEntryMetadata = legacy::StorageEntryMetadata<8>;
using StorageMetadata = legacy::StorageMetadata<8>;
using ModuleMetadata = legacy::ModuleMetadata<8>;
using RuntimeMetadataV8 = legacy::RuntimeMetadata<8>;
} // namespace ChainMeta::v8

namespace ChainMeta::v9 {
using legacy::FunctionArgumentMetadata;
using legacy::FunctionMetadata;
using legacy::EventMetadata;
using legacy::ModuleConstantMetadata;
using legacy::ErrorMetadata;
using StorageEntryMetadata = legacy::StorageEntryMetadata<9>;
using StorageMetadata = legacy::StorageMetadata<9>;
using ModuleMetadata = legacy::ModuleMetadata<9>;
using RuntimeMetadataV9 = legacy::RuntimeMetadata<9>;
} // namespace ChainMeta::v9

namespace ChainMeta::v10 {
using legacy::FunctionArgumentMetadata;
using legacy::FunctionMetadata;
using legacy::EventMetadata;
using legacy::ModuleConstantMetadata;
using legacy::ErrorMetadata;
using StorageEntryMetadata = legacy::StorageEntryMetadata<10>;
using StorageMetadata = legacy::StorageMetadata<10>;
using ModuleMetadata = legacy::ModuleMetadata<10>;
using RuntimeMetadataV10 = legacy::RuntimeMetadata<10>;
} // namespace ChainMeta::v10

namespace ChainMeta::v11 {
using legacy::FunctionArgumentMetadata;
using legacy::FunctionMetadata;
using legacy::EventMetadata;
using legacy::ModuleConstantMetadata;
using legacy::ErrorMetadata;
using legacy::ExtrinsicMetadata;
using StorageEntryMetadata = legacy::StorageEntryMetadata<11>;
using StorageMetadata = legacy::StorageMetadata<11>;
using ModuleMetadata = legacy::ModuleMetadata<11>;
using RuntimeMetadataV11 = legacy::RuntimeMetadata<11>;
} // namespace ChainMeta::v11

namespace ChainMeta::v12 {
using legacy::FunctionArgumentMetadata;
using legacy::FunctionMetadata;
using legacy::EventMetadata;
using legacy::ModuleConstantMetadata;
using legacy::ErrorMetadata;
using legacy::ExtrinsicMetadata;
using StorageEntryMetadata = legacy::StorageEntryMetadata<12>;
using StorageMetadata = legacy::StorageMetadata<12>;
using ModuleMetadata = legacy::ModuleMetadata<12>;
using RuntimeMetadataV12 = legacy::RuntimeMetadata<12>;
} // namespace ChainMeta::v12

namespace ChainMeta::v13 {
using legacy::FunctionArgumentMetadata;
using legacy::FunctionMetadata;
using legacy::EventMetadata;
using legacy::ModuleConstantMetadata;
using legacy::ErrorMetadata;
using legacy::ExtrinsicMetadata;
using StorageEntryMetadata = legacy::StorageEntryMetadata<13>;
using StorageMetadata = legacy::StorageMetadata<13>;
using ModuleMetadata = legacy::ModuleMetadata<13>;
using RuntimeMetadataV13 = legacy::RuntimeMetadata<13>;
} // namespace ChainMeta::v13

#endif // CHAINMETA_LEGACY_VERSIONS_H
