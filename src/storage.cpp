#include "chainmeta/storage.h"

#include <array>
#include <span>

#include "chainmeta/logger.h"

namespace ChainMeta {

namespace {

using H = StorageHasher;

// Wire order of each historical hasher set
constexpr std::array<StorageHasher, 5> kHashersV8 = {
    H::Blake2_128, H::Blake2_256, H::Twox128, H::Twox256, H::Twox64Concat};
constexpr std::array<StorageHasher, 6> kHashersV10 = {
    H::Blake2_128, H::Blake2_256, H::Blake2_128Concat, H::Twox128, H::Twox256, H::Twox64Concat};
constexpr std::array<StorageHasher, 7> kHashersV11 = {
    H::Blake2_128, H::Blake2_256, H::Blake2_128Concat, H::Twox128, H::Twox256, H::Twox64Concat, H::Identity};

std::span<const StorageHasher> wire_table(uint8_t version) {
    if (version <= 9) {
        return kHashersV8;
    }
    if (version == 10) {
        return kHashersV10;
    }
    return kHashersV11;
}

} // namespace

const char* hasher_name(StorageHasher hasher) {
    switch (hasher) {
        case H::Blake2_128: return "Blake2_128";
        case H::Blake2_256: return "Blake2_256";
        case H::Blake2_128Concat: return "Blake2_128Concat";
        case H::Twox128: return "Twox128";
        case H::Twox256: return "Twox256";
        case H::Twox64Concat: return "Twox64Concat";
        case H::Identity: return "Identity";
    }
    return "?";
}

const char* modifier_name(StorageEntryModifier modifier) {
    return modifier == StorageEntryModifier::Optional ? "Optional" : "Default";
}

bool hasher_supported(StorageHasher hasher, uint8_t version) {
    for (StorageHasher h : wire_table(version)) {
        if (h == hasher) {
            return true;
        }
    }
    return false;
}

void encode_hasher(scale::Writer& writer, StorageHasher hasher, uint8_t version) {
    auto table = wire_table(version);
    for (size_t i = 0; i < table.size(); ++i) {
        if (table[i] == hasher) {
            writer.write_u8(static_cast<uint8_t>(i));
            return;
        }
    }
    throw scale::EncodeError(detail::format("hasher %s does not exist in metadata V%u",
                                            hasher_name(hasher), static_cast<unsigned>(version)));
}

StorageHasher decode_hasher(scale::Reader& reader, uint8_t version) {
    auto table = wire_table(version);
    uint8_t tag = reader.read_tag("StorageHasher", static_cast<uint8_t>(table.size() - 1));
    return table[tag];
}

} // namespace ChainMeta
