#ifndef CHAINMETA_TESTS_TEST_SUPPORT_H
#define CHAINMETA_TESTS_TEST_SUPPORT_H

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "chainmeta/chainmeta.h"

// Sample trees shared by the test suites

namespace ChainMeta::test {

inline RuntimeMetadataPrefixed wrap(RuntimeMetadata metadata) {
    return RuntimeMetadataPrefixed(std::move(metadata));
}

/// Encodes a tree without the closed-world check, for building invalid inputs.
template<typename Tree>
std::vector<uint8_t> encode_unchecked(const Tree& tree) {
    scale::Writer writer;
    writer.write_u32_le(kMetadataMagic);
    writer.write_u8(Tree::kVersion);
    scale::encode(writer, tree);
    return writer.take_buffer();
}

// =============================================================================
// String-typed versions
// =============================================================================

template<uint8_t V>
legacy::RuntimeMetadata<V> sample_legacy() {
    legacy::StorageEntryMetadata<V> account;
    account.name = "Account";
    account.modifier = StorageEntryModifier::Default;
    account.ty = legacy::MapStorage{legacy::MapShape::Map,
                                    {legacy::StorageKey{StorageHasher::Blake2_256, "T::AccountId"}},
                                    "AccountInfo<T::Index, T::AccountData>",
                                    false};
    account.default_value = {0, 0, 0, 0};
    account.documentation = {" The full account information for a particular account ID."};

    legacy::StorageEntryMetadata<V> number;
    number.name = "Number";
    number.modifier = StorageEntryModifier::Optional;
    number.ty = legacy::PlainStorage{"T::BlockNumber"};

    legacy::StorageEntryMetadata<V> approvals;
    approvals.name = "Approvals";
    approvals.modifier = StorageEntryModifier::Default;
    approvals.ty = legacy::MapStorage{legacy::MapShape::DoubleMap,
                                      {legacy::StorageKey{StorageHasher::Blake2_128, "T::AccountId"},
                                       legacy::StorageKey{StorageHasher::Twox64Concat, "T::Hash"}},
                                      "bool",
                                      false};
    approvals.default_value = {0};

    legacy::StorageMetadata<V> storage;
    storage.prefix = "System";
    storage.entries = {account, number, approvals};

    legacy::ModuleMetadata<V> system;
    system.name = "System";
    system.storage = storage;
    system.calls = std::vector<legacy::FunctionMetadata>{
        legacy::FunctionMetadata{"remark",
                                 {legacy::FunctionArgumentMetadata{"_remark", "Vec<u8>"}},
                                 {" Make some on-chain remark."}},
        legacy::FunctionMetadata{"noop", {}, {}}};
    system.event = std::vector<legacy::EventMetadata>{
        legacy::EventMetadata{"ExtrinsicSuccess", {"DispatchInfo"}, {" An extrinsic completed successfully."}}};
    system.constants = {legacy::ModuleConstantMetadata{"BlockHashCount", "T::BlockNumber", {0x60, 0x09, 0, 0}, {}}};
    system.errors = {legacy::ErrorMetadata{"InvalidSpecName", {" The name of specification does not match."}}};

    legacy::ModuleMetadata<V> timestamp;
    timestamp.name = "Timestamp";
    timestamp.calls = std::vector<legacy::FunctionMetadata>{};

    if constexpr (V >= 12) {
        system.index = 0;
        timestamp.index = 3;
    }

    legacy::RuntimeMetadata<V> tree;
    tree.modules = {system, timestamp};
    if constexpr (V >= 11) {
        tree.extrinsic = legacy::ExtrinsicMetadata{4, {"CheckNonce", "CheckWeight"}};
    }
    return tree;
}

// =============================================================================
// Registry-backed versions
// =============================================================================

/// One pallet, one plain storage entry of type u128.
inline v16::RuntimeMetadataV16 balances_v16() {
    TypeRegistryBuilder builder;
    TypeId u128 = builder.add(TypeDescriptor::primitive(Primitive::U128));

    v16::StorageEntryMetadata total;
    total.name = "TotalIssuance";
    total.modifier = StorageEntryModifier::Default;
    total.ty = modern::PlainStorageType{u128};
    total.default_value = std::vector<uint8_t>(16, 0);
    total.docs = {" The total units issued in the system."};

    v16::PalletStorageMetadata storage;
    storage.prefix = "Balances";
    storage.entries = {total};

    v16::PalletMetadata balances;
    balances.name = "Balances";
    balances.storage = storage;
    balances.index = 5;

    v16::RuntimeMetadataV16 tree;
    tree.types = std::move(builder).build().value();
    tree.pallets = {balances};
    return tree;
}

/**
 * Registry layout of sample_v14():
 *   0 u8, 1 u128, 2 RuntimeCall, 3 AccountId32, 4 MultiSignature, 5 (),
 *   6 UncheckedExtrinsic<Address=3, Call=2, Signature=4, Extra=5>,
 *   7 Vec<u8>, 8 [u8; 32], 9 [u8; 64], 10 Runtime
 */
inline v14::RuntimeMetadataV14 sample_v14(bool name_extrinsic_parts = true) {
    TypeRegistryBuilder builder;
    builder.add(TypeDescriptor::primitive(Primitive::U8));
    builder.add(TypeDescriptor::primitive(Primitive::U128));
    builder.add(TypeDescriptor::variant(
        {"node_runtime", "RuntimeCall"},
        {Variant{"remark", {Field{"remark", TypeId{7}, "Vec<u8>", {}}}, 0, {}},
         Variant{"noop", {}, 1, {}}}));
    builder.add(TypeDescriptor::composite({"sp_core", "crypto", "AccountId32"},
                                          {Field{std::nullopt, TypeId{8}, "[u8; 32]", {}}}));
    builder.add(TypeDescriptor::variant({"sp_runtime", "MultiSignature"},
                                        {Variant{"Sr25519", {Field{std::nullopt, TypeId{9}, std::nullopt, {}}}, 1, {}}}));
    builder.add(TypeDescriptor::tuple({}));

    TypeDescriptor extrinsic = TypeDescriptor::composite({"sp_runtime", "generic", "UncheckedExtrinsic"},
                                                         {Field{std::nullopt, TypeId{7}, std::nullopt, {}}});
    if (name_extrinsic_parts) {
        extrinsic.type_params = {TypeParameter{"Address", TypeId{3}},
                                 TypeParameter{"Call", TypeId{2}},
                                 TypeParameter{"Signature", TypeId{4}},
                                 TypeParameter{"Extra", TypeId{5}}};
    }
    builder.add(std::move(extrinsic));
    builder.add(TypeDescriptor::sequence(TypeId{0}));
    builder.add(TypeDescriptor::array(32, TypeId{0}));
    builder.add(TypeDescriptor::array(64, TypeId{0}));
    builder.add(TypeDescriptor::composite({"node_runtime", "Runtime"}, {}));

    v14::StorageEntryMetadata account;
    account.name = "Account";
    account.modifier = StorageEntryModifier::Default;
    account.ty = modern::MapStorageType{{StorageHasher::Blake2_128Concat}, TypeId{3}, TypeId{1}};
    account.default_value = std::vector<uint8_t>(16, 0);

    v14::PalletMetadata system;
    system.name = "System";
    system.storage = v14::PalletStorageMetadata{"System", {account}};
    system.calls = v14::PalletCallMetadata{TypeId{2}};
    system.constants = {v14::PalletConstantMetadata{"BlockHashCount", TypeId{1}, std::vector<uint8_t>(16, 1), {}}};
    system.index = 0;

    v14::StorageEntryMetadata total;
    total.name = "TotalIssuance";
    total.modifier = StorageEntryModifier::Default;
    total.ty = modern::PlainStorageType{TypeId{1}};
    total.default_value = std::vector<uint8_t>(16, 0);

    v14::PalletMetadata balances;
    balances.name = "Balances";
    balances.storage = v14::PalletStorageMetadata{"Balances", {total}};
    balances.error = v14::PalletErrorMetadata{TypeId{2}};
    balances.index = 5;

    v14::RuntimeMetadataV14 tree;
    tree.types = std::move(builder).build().value();
    tree.pallets = {system, balances};
    tree.extrinsic.ty = TypeId{6};
    tree.extrinsic.version = 4;
    tree.extrinsic.signed_extensions = {modern::SignedExtensionMetadata{"CheckNonce", TypeId{1}, TypeId{5}},
                                        modern::SignedExtensionMetadata{"CheckGenesis", TypeId{5}, TypeId{8}}};
    tree.ty = TypeId{10};
    return tree;
}

/// sample_v14() upgraded, plus a runtime API and custom values.
inline v15::RuntimeMetadataV15 sample_v15() {
    v15::RuntimeMetadataV15 tree = upgrade(sample_v14()).value();
    tree.pallets[1].docs = {" The balances pallet."};

    v15::RuntimeApiMethodMetadata account_nonce;
    account_nonce.name = "account_nonce";
    account_nonce.inputs = {modern::RuntimeApiMethodParamMetadata{"account", TypeId{3}}};
    account_nonce.output = TypeId{1};
    account_nonce.docs = {" Get current account nonce of given AccountId."};
    tree.apis = {v15::RuntimeApiMetadata{"AccountNonceApi", {account_nonce}, {}}};

    tree.outer_enums.event_enum_ty = TypeId{2};
    tree.custom.map["chain"] = modern::CustomValueMetadata{TypeId{7}, {0x0c, 'd', 'e', 'v'}};
    tree.custom.map["decimals"] = modern::CustomValueMetadata{TypeId{0}, {12}};
    return tree;
}

/**
 * Current-version tree that touches every record kind.
 *
 * Registry: 0 u8, 1 u32, 2 u128, 3 [u8; 32], 4 AccountId32, 5 Call enum,
 * 6 (AccountId32, u32), 7 Vec<u8>, 8 Compact<u128>, 9 BitVec<AccountId32, u8>
 */
inline v16::RuntimeMetadataV16 sample_v16() {
    TypeRegistryBuilder builder;
    builder.add(TypeDescriptor::primitive(Primitive::U8));
    builder.add(TypeDescriptor::primitive(Primitive::U32));
    builder.add(TypeDescriptor::primitive(Primitive::U128));
    builder.add(TypeDescriptor::array(32, TypeId{0}));
    builder.add(TypeDescriptor::composite({"sp_core", "crypto", "AccountId32"},
                                          {Field{std::nullopt, TypeId{3}, "[u8; 32]", {}}}));
    builder.add(TypeDescriptor::variant(
        {"pallet_balances", "pallet", "Call"},
        {Variant{"transfer", {Field{"dest", TypeId{4}, "AccountId", {}}, Field{"value", TypeId{8}, "Balance", {}}}, 0,
                 {" Transfer some liquid free balance to another account."}},
         Variant{"burn", {}, 1, {}}}));
    builder.add(TypeDescriptor::tuple({TypeId{4}, TypeId{1}}));
    builder.add(TypeDescriptor::sequence(TypeId{0}));
    builder.add(TypeDescriptor::compact(TypeId{2}));
    builder.add(TypeDescriptor::bit_sequence(TypeId{0}, TypeId{4}));

    v16::StorageEntryMetadata total;
    total.name = "TotalIssuance";
    total.modifier = StorageEntryModifier::Default;
    total.ty = modern::PlainStorageType{TypeId{2}};
    total.default_value = std::vector<uint8_t>(16, 0);

    v16::StorageEntryMetadata account;
    account.name = "Account";
    account.modifier = StorageEntryModifier::Default;
    account.ty = modern::MapStorageType{{StorageHasher::Blake2_128Concat}, TypeId{4}, TypeId{2}};
    account.default_value = std::vector<uint8_t>(16, 0);
    account.deprecation_info = v16::DeprecationStatus::without_note();

    v16::StorageEntryMetadata locks;
    locks.name = "Locks";
    locks.modifier = StorageEntryModifier::Optional;
    locks.ty = modern::MapStorageType{{StorageHasher::Blake2_128Concat, StorageHasher::Twox64Concat}, TypeId{6}, TypeId{1}};

    v16::PalletStorageMetadata storage;
    storage.prefix = "Balances";
    storage.entries = {total, account, locks};

    v16::DeprecationInfo call_deprecation;
    call_deprecation.kind = v16::DeprecationInfo::Kind::VariantsDeprecated;
    call_deprecation.variants[1] = v16::DeprecationStatus::deprecated("use transfer", "1.2.0");

    v16::DeprecationInfo event_deprecation;
    event_deprecation.kind = v16::DeprecationInfo::Kind::ItemDeprecated;
    event_deprecation.item = v16::DeprecationStatus::without_note();

    v16::PalletViewFunctionMetadata free_balance;
    free_balance.name = "free_balance";
    for (size_t i = 0; i < free_balance.id.size(); ++i) {
        free_balance.id[i] = static_cast<uint8_t>(i);
    }
    free_balance.inputs = {modern::RuntimeApiMethodParamMetadata{"who", TypeId{4}}};
    free_balance.output = TypeId{2};
    free_balance.deprecation_info = v16::DeprecationStatus::deprecated("query the account instead");

    v16::PalletMetadata balances;
    balances.name = "Balances";
    balances.storage = storage;
    balances.calls = v16::PalletCallMetadata{TypeId{5}, call_deprecation};
    balances.event = v16::PalletEventMetadata{TypeId{5}, event_deprecation};
    balances.constants = {v16::PalletConstantMetadata{"ExistentialDeposit", TypeId{2}, std::vector<uint8_t>(16, 1),
                                                      {" The minimum amount required to keep an account open."},
                                                      v16::DeprecationStatus::not_deprecated()}};
    balances.error = v16::PalletErrorMetadata{TypeId{5}, v16::DeprecationInfo{}};
    balances.associated_types = {v16::PalletAssociatedTypeMetadata{"Balance", TypeId{2}, {}}};
    balances.view_functions = {free_balance};
    balances.index = 5;
    balances.docs = {" The balances pallet."};

    v16::PalletMetadata system;
    system.name = "System";
    system.index = 0;

    v16::RuntimeApiMethodMetadata version;
    version.name = "version";
    version.output = TypeId{1};
    version.docs = {" Returns the version of the runtime."};

    v16::RuntimeApiMetadata core;
    core.name = "Core";
    core.methods = {version};
    core.version = 5;

    v16::RuntimeMetadataV16 tree;
    tree.types = std::move(builder).build().value();
    tree.pallets = {system, balances};
    tree.extrinsic.versions = {4, 5};
    tree.extrinsic.address_ty = TypeId{4};
    tree.extrinsic.signature_ty = TypeId{7};
    tree.extrinsic.transaction_extensions = {v16::TransactionExtensionMetadata{"CheckNonce", TypeId{8}, TypeId{9}},
                                             v16::TransactionExtensionMetadata{"CheckWeight", TypeId{6}, TypeId{7}}};
    tree.extrinsic.transaction_extensions_by_version[0] = {scale::Compact<uint32_t>{0}, scale::Compact<uint32_t>{1}};
    tree.extrinsic.transaction_extensions_by_version[1] = {scale::Compact<uint32_t>{1}};
    tree.apis = {core};
    tree.outer_enums.call_enum_ty = TypeId{5};
    tree.outer_enums.event_enum_ty = TypeId{5};
    tree.custom.map["ss58_prefix"] = modern::CustomValueMetadata{TypeId{1}, {42, 0, 0, 0}};
    return tree;
}

} // namespace ChainMeta::test

#endif // CHAINMETA_TESTS_TEST_SUPPORT_H
