#ifndef CHAINMETA_STORAGE_H
#define CHAINMETA_STORAGE_H

#include <cstdint>

#include "chainmeta/config.h"
#include "chainmeta/scale/scale.h"

namespace ChainMeta {

/**
 * @brief Hash function applied to a storage map key.
 *
 * Enumerators follow the modern wire order. Older versions carry smaller
 * hasher sets with their own indices; use encode_hasher/decode_hasher with
 * the version being processed.
 */
enum class StorageHasher : uint8_t {
    Blake2_128,
    Blake2_256,
    Blake2_128Concat,
    Twox128,
    Twox256,
    Twox64Concat,
    Identity
};

const char* hasher_name(StorageHasher hasher);

/// Whether version can carry hasher at all.
bool hasher_supported(StorageHasher hasher, uint8_t version);

/// Throws scale::EncodeError when the hasher does not exist in that version.
void encode_hasher(scale::Writer& writer, StorageHasher hasher, uint8_t version);
StorageHasher decode_hasher(scale::Reader& reader, uint8_t version);

/**
 * @brief What a read of a missing storage value yields.
 *
 * Optional: the value is absent. Default: the entry's declared default bytes.
 * Every entry also carries those default bytes, which are the raw fallback
 * for encodings that predate typed defaults.
 */
enum class StorageEntryModifier : uint8_t {
    Optional,
    Default
};

const char* modifier_name(StorageEntryModifier modifier);

} // namespace ChainMeta

namespace ChainMeta::scale {

template<> struct scale_traits<StorageEntryModifier> {
    static void encode(Writer& w, StorageEntryModifier m) { w.write_u8(static_cast<uint8_t>(m)); }
    static StorageEntryModifier decode(Reader& r) {
        return static_cast<StorageEntryModifier>(r.read_tag("StorageEntryModifier", 1));
    }
};

} // namespace ChainMeta::scale

#endif // CHAINMETA_STORAGE_H
