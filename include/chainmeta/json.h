#ifndef CHAINMETA_JSON_H
#define CHAINMETA_JSON_H

#include <span>
#include <string>

#include <nlohmann/json.hpp>

#include "chainmeta/error_handling.h"
#include "chainmeta/metadata.h"

/**
 * @file json.h
 * @brief Human-readable projection of metadata trees
 *
 * The projection carries the same information as the wire form but is not
 * meant to be decoded back. Conventions:
 * - tagged unions are externally tagged objects, `{"Map": {...}}`, and
 *   unit variants are plain strings, `"NotDeprecated"`
 * - byte blobs are `0x`-prefixed lowercase hex
 * - type references are numbers, TypeId::unspecified() is null
 * - the envelope is `{"magic": ..., "metadata": {"V16": {...}}}`
 */

namespace ChainMeta {

/// `0x`-prefixed lowercase hex.
std::string to_hex(std::span<const uint8_t> bytes);

nlohmann::json to_json(const TypeDescriptor& descriptor);

/// Array of `{"id": n, "type": {...}}` in registry order.
nlohmann::json to_json(const TypeRegistry& registry);

nlohmann::json to_json(const v8::RuntimeMetadataV8& metadata);
nlohmann::json to_json(const v9::RuntimeMetadataV9& metadata);
nlohmann::json to_json(const v10::RuntimeMetadataV10& metadata);
nlohmann::json to_json(const v11::RuntimeMetadataV11& metadata);
nlohmann::json to_json(const v12::RuntimeMetadataV12& metadata);
nlohmann::json to_json(const v13::RuntimeMetadataV13& metadata);
nlohmann::json to_json(const v14::RuntimeMetadataV14& metadata);
nlohmann::json to_json(const v15::RuntimeMetadataV15& metadata);
nlohmann::json to_json(const v16::RuntimeMetadataV16& metadata);

/// `{"V<n>": tree}`
nlohmann::json to_json(const RuntimeMetadata& metadata);
nlohmann::json to_json(const RuntimeMetadataPrefixed& prefixed);

/// Error kind plus whatever context the error carries.
nlohmann::json to_json(const MetadataError& error);

/**
 * Serialized projection of the envelope; indent < 0 gives the compact form.
 * Invalid UTF-8 in hand-built trees is replaced with U+FFFD.
 */
std::string to_json_string(const RuntimeMetadataPrefixed& prefixed, int indent = 2);

} // namespace ChainMeta

#endif // CHAINMETA_JSON_H
