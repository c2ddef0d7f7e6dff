#ifndef CHAINMETA_CHAINMETA_H
#define CHAINMETA_CHAINMETA_H

/**
 * @file chainmeta.h
 * @brief Single include for the whole library
 *
 * Decode an envelope, inspect it, and move it to the current version:
 * @code
 * auto decoded = ChainMeta::decode(bytes);
 * if (!decoded) {
 *     LOG_ERROR(decoded.error().to_string());
 *     return;
 * }
 * auto current = ChainMeta::convert_to(decoded.value(), ChainMeta::kCurrentVersion,
 *                                      ChainMeta::ConversionPolicy::AllowLossy);
 * @endcode
 */

#include "chainmeta/config.h"
#include "chainmeta/convert.h"
#include "chainmeta/error_handling.h"
#include "chainmeta/json.h"
#include "chainmeta/logger.h"
#include "chainmeta/metadata.h"
#include "chainmeta/outcome.h"
#include "chainmeta/type_registry.h"

#endif // CHAINMETA_CHAINMETA_H
