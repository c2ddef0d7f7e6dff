#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "chainmeta/chainmeta.h"
#include "tests/test_support.h"

namespace ChainMeta {
namespace {

using test::wrap;

class ModernTest : public ::testing::Test {
protected:
    template<typename Tree>
    static Tree round_trip(const Tree& tree) {
        auto bytes = encode(wrap(tree));
        EXPECT_TRUE(bytes.is_ok()) << bytes.error().to_string();
        auto decoded = decode(bytes.value());
        EXPECT_TRUE(decoded.is_ok()) << decoded.error().to_string();
        return std::get<Tree>(decoded.value().metadata);
    }
};

// =============================================================================
// Round Trip Tests
// =============================================================================

TEST_F(ModernTest, BalancesStorageResolvesToU128) {
    auto tree = round_trip(test::balances_v16());

    ASSERT_EQ(tree.pallets.size(), 1u);
    const auto& pallet = tree.pallets[0];
    EXPECT_EQ(pallet.name, "Balances");
    EXPECT_EQ(pallet.index, 5);
    ASSERT_TRUE(pallet.storage.has_value());
    ASSERT_EQ(pallet.storage->entries.size(), 1u);

    const auto& entry = pallet.storage->entries[0];
    EXPECT_EQ(entry.name, "TotalIssuance");
    EXPECT_EQ(entry.modifier, StorageEntryModifier::Default);
    EXPECT_EQ(entry.default_value.size(), 16u);

    const auto& plain = std::get<modern::PlainStorageType>(entry.ty);
    auto resolved = tree.types.resolve(plain.value);
    ASSERT_TRUE(resolved.is_ok());
    EXPECT_EQ(std::get<TypeDefPrimitive>(resolved.value()->def).primitive, Primitive::U128);
}

TEST_F(ModernTest, V14RoundTrip) {
    auto tree = test::sample_v14();
    EXPECT_EQ(round_trip(tree), tree);
}

TEST_F(ModernTest, V15RoundTrip) {
    auto tree = test::sample_v15();
    auto decoded = round_trip(tree);
    EXPECT_EQ(decoded, tree);
    EXPECT_EQ(decoded.apis[0].methods[0].inputs[0].ty, TypeId{3});
    ASSERT_EQ(decoded.custom.map.size(), 2u);
    EXPECT_EQ(decoded.custom.map.begin()->first, "chain");
}

TEST_F(ModernTest, V16RoundTripKeepsEveryRecordKind) {
    auto tree = test::sample_v16();
    auto decoded = round_trip(tree);
    EXPECT_EQ(decoded, tree);

    const auto& balances = decoded.pallets[1];
    EXPECT_EQ(balances.calls->deprecation_info.kind, v16::DeprecationInfo::Kind::VariantsDeprecated);
    EXPECT_EQ(balances.calls->deprecation_info.variants.at(1).since, std::optional<std::string>("1.2.0"));
    EXPECT_EQ(balances.event->deprecation_info.item.kind, v16::DeprecationStatus::Kind::DeprecatedWithoutNote);
    EXPECT_EQ(balances.view_functions[0].id[31], 31);
    EXPECT_EQ(balances.associated_types[0].name, "Balance");
    EXPECT_EQ(decoded.apis[0].version, 5u);
    EXPECT_TRUE(decoded.outer_enums.error_enum_ty.is_unspecified());
}

TEST_F(ModernTest, EmptyDocsAndAbsentItemsRoundTrip) {
    v16::RuntimeMetadataV16 tree;
    v16::PalletMetadata bare;
    bare.name = "Bare";
    bare.index = 255;
    tree.pallets = {bare};

    EXPECT_EQ(round_trip(tree), tree);
}

TEST_F(ModernTest, EveryPalletIndexRoundTrips) {
    auto tree = test::sample_v16();
    const auto balances = tree.pallets[1];
    tree.pallets.clear();
    for (int i = 0; i < 256; ++i) {
        auto pallet = balances;
        pallet.name = "Pallet" + std::to_string(i);
        pallet.index = static_cast<uint8_t>(i);
        tree.pallets.push_back(std::move(pallet));
    }

    auto decoded = round_trip(tree);
    EXPECT_EQ(decoded, tree);
    EXPECT_EQ(decoded.pallets.back().index, 255);
    EXPECT_EQ(decoded.pallets.back().storage->entries.size(), 3u);
}

// =============================================================================
// Deprecation Payload Tests
// =============================================================================

TEST_F(ModernTest, NoteOnUndeprecatedItemIsRefused) {
    auto tree = test::sample_v16();
    tree.pallets[0].deprecation_info.note = "stale";

    auto bytes = encode(wrap(tree));
    ASSERT_TRUE(bytes.is_err());
    EXPECT_EQ(bytes.error().kind, MetadataErrorKind::MalformedPayload);
    EXPECT_EQ(bytes.error().version, 16);

    tree.pallets[0].deprecation_info = v16::DeprecationStatus::without_note();
    tree.pallets[0].deprecation_info.since = "1.0.0";
    EXPECT_TRUE(encode(wrap(tree)).is_err());

    tree.pallets[0].deprecation_info = v16::DeprecationStatus::deprecated("stale");
    EXPECT_EQ(round_trip(tree), tree);
}

TEST_F(ModernTest, DeprecationInfoPayloadMustMatchKind) {
    auto tree = test::sample_v16();
    auto& calls = tree.pallets[1].calls->deprecation_info;

    calls.kind = v16::DeprecationInfo::Kind::NotDeprecated;
    EXPECT_TRUE(encode(wrap(tree)).is_err());

    calls.kind = v16::DeprecationInfo::Kind::ItemDeprecated;
    EXPECT_TRUE(encode(wrap(tree)).is_err());

    calls.variants.clear();
    calls.item = v16::DeprecationStatus::deprecated("whole enum");
    EXPECT_EQ(round_trip(tree), tree);

    calls.kind = v16::DeprecationInfo::Kind::VariantsDeprecated;
    EXPECT_TRUE(encode(wrap(tree)).is_err());
}

// =============================================================================
// Storage Key Tests
// =============================================================================

TEST_F(ModernTest, SingleHasherKeyIsTheKeyType) {
    auto tree = test::sample_v16();
    const auto& map = std::get<modern::MapStorageType>(tree.pallets[1].storage->entries[1].ty);

    auto keys = map.keys(tree.types);
    ASSERT_TRUE(keys.is_ok());
    ASSERT_EQ(keys.value().size(), 1u);
    EXPECT_EQ(keys.value()[0].hasher, StorageHasher::Blake2_128Concat);
    EXPECT_EQ(keys.value()[0].key, TypeId{4});
}

TEST_F(ModernTest, MultipleHashersSplitTheKeyTuple) {
    auto tree = test::sample_v16();
    const auto& map = std::get<modern::MapStorageType>(tree.pallets[1].storage->entries[2].ty);

    auto keys = map.keys(tree.types);
    ASSERT_TRUE(keys.is_ok()) << keys.error().to_string();
    ASSERT_EQ(keys.value().size(), 2u);
    EXPECT_EQ(keys.value()[0].hasher, StorageHasher::Blake2_128Concat);
    EXPECT_EQ(keys.value()[0].key, TypeId{4});
    EXPECT_EQ(keys.value()[1].hasher, StorageHasher::Twox64Concat);
    EXPECT_EQ(keys.value()[1].key, TypeId{1});
}

TEST_F(ModernTest, HasherCountMustMatchTupleArity) {
    auto tree = test::sample_v16();
    modern::MapStorageType map{{StorageHasher::Blake2_128Concat, StorageHasher::Twox64Concat, StorageHasher::Identity},
                               TypeId{6},
                               TypeId{1}};
    auto keys = map.keys(tree.types);
    ASSERT_TRUE(keys.is_err());
    EXPECT_EQ(keys.error().kind, MetadataErrorKind::MalformedPayload);

    map.key = TypeId{2};
    EXPECT_TRUE(map.keys(tree.types).is_err());
}

TEST_F(ModernTest, MapStorageWireForm) {
    modern::MapStorageType map{{StorageHasher::Blake2_128Concat, StorageHasher::Identity}, TypeId{6}, TypeId{1}};
    scale::Writer writer;
    modern::encode_storage_entry_type(writer, map);
    EXPECT_EQ(writer.buffer(), (std::vector<uint8_t>{0x01, 0x08, 0x02, 0x06, 0x18, 0x04}));

    scale::Reader reader(writer.buffer());
    EXPECT_EQ(std::get<modern::MapStorageType>(modern::decode_storage_entry_type(reader)), map);
}

// =============================================================================
// Closed-World Tests
// =============================================================================

TEST_F(ModernTest, DanglingCallTypeIsNamedByPallet) {
    auto tree = test::sample_v16();
    tree.pallets[1].calls->ty = TypeId{77};

    auto checked = tree.validate();
    ASSERT_TRUE(checked.is_err());
    EXPECT_EQ(checked.error().kind, MetadataErrorKind::DanglingTypeReference);
    EXPECT_EQ(checked.error().type_id, 77u);
    EXPECT_EQ(checked.error().version, 16);
    EXPECT_EQ(checked.error().field_path, "pallets[Balances].calls.ty");

    auto bytes = encode(wrap(tree));
    ASSERT_TRUE(bytes.is_err());
    EXPECT_EQ(bytes.error().kind, MetadataErrorKind::DanglingTypeReference);
}

TEST_F(ModernTest, DanglingStorageTypeIsNamedByEntry) {
    auto tree = test::sample_v14();
    tree.pallets[1].storage->entries[0].ty = modern::PlainStorageType{TypeId{40}};

    auto checked = tree.validate();
    ASSERT_TRUE(checked.is_err());
    EXPECT_EQ(checked.error().field_path, "pallets[Balances].storage[TotalIssuance].ty.Plain");
    EXPECT_EQ(checked.error().version, 14);
}

TEST_F(ModernTest, DanglingCustomValueType) {
    auto tree = test::sample_v15();
    tree.custom.map["chain"].ty = TypeId{500};

    auto checked = tree.validate();
    ASSERT_TRUE(checked.is_err());
    EXPECT_EQ(checked.error().field_path, "custom.map[chain].ty");
}

TEST_F(ModernTest, UnspecifiedIsOnlyAllowedInOptionalSlots) {
    auto tree = test::sample_v16();
    tree.outer_enums.call_enum_ty = TypeId::unspecified();
    tree.extrinsic.address_ty = TypeId::unspecified();
    EXPECT_TRUE(tree.validate().is_ok());

    tree.pallets[1].error->ty = TypeId::unspecified();
    auto checked = tree.validate();
    ASSERT_TRUE(checked.is_err());
    EXPECT_EQ(checked.error().field_path, "pallets[Balances].error.ty");
}

TEST_F(ModernTest, ExtensionIndicesMustPointIntoTheList) {
    auto tree = test::sample_v16();
    tree.extrinsic.transaction_extensions_by_version[1].push_back(scale::Compact<uint32_t>{2});

    auto checked = tree.validate();
    ASSERT_TRUE(checked.is_err());
    EXPECT_EQ(checked.error().kind, MetadataErrorKind::MalformedPayload);
    EXPECT_EQ(checked.error().field_path, "extrinsic.transaction_extensions_by_version[1]");
}

TEST_F(ModernTest, DecodeRejectsDanglingReference) {
    auto tree = test::sample_v15();
    tree.apis[0].methods[0].output = TypeId{64};

    auto decoded = decode(test::encode_unchecked(tree));
    ASSERT_TRUE(decoded.is_err());
    EXPECT_EQ(decoded.error().kind, MetadataErrorKind::DanglingTypeReference);
    EXPECT_EQ(decoded.error().version, 15);
    EXPECT_EQ(decoded.error().type_id, 64u);
}

TEST_F(ModernTest, RegistryCycleInsideTreeIsValid) {
    TypeRegistryBuilder builder;
    TypeId call = builder.reserve();
    TypeId boxed = builder.add(TypeDescriptor::sequence(call));
    ASSERT_TRUE(builder.define(call, TypeDescriptor::variant(
        {"RuntimeCall"}, {Variant{"batch", {Field{"calls", boxed, std::nullopt, {}}}, 0, {}}})).is_ok());

    v16::RuntimeMetadataV16 tree;
    tree.types = std::move(builder).build().value();
    tree.outer_enums.call_enum_ty = call;

    EXPECT_TRUE(tree.validate().is_ok());
    EXPECT_EQ(round_trip(tree), tree);
}

} // namespace
} // namespace ChainMeta
