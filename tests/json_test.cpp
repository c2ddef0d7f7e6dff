#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chainmeta/chainmeta.h"
#include "tests/test_support.h"

namespace ChainMeta {
namespace {

using nlohmann::json;
using test::wrap;

class JsonTest : public ::testing::Test {};

// =============================================================================
// Scalar Convention Tests
// =============================================================================

TEST_F(JsonTest, BytesAreLowercaseHex) {
    EXPECT_EQ(to_hex(std::vector<uint8_t>{}), "0x");
    EXPECT_EQ(to_hex(std::vector<uint8_t>{0xde, 0xad, 0x00, 0x0f}), "0xdead000f");
}

TEST_F(JsonTest, TypeDefinitionsAreExternallyTagged) {
    auto tree = test::sample_v16();
    json types = to_json(tree.types);
    ASSERT_EQ(types.size(), 10u);

    EXPECT_EQ(types[2]["id"], 2);
    EXPECT_EQ(types[2]["type"]["def"], json::parse(R"({"Primitive": "u128"})"));
    EXPECT_EQ(types[3]["type"]["def"], json::parse(R"({"Array": {"len": 32, "element": 0}})"));
    EXPECT_EQ(types[6]["type"]["def"], json::parse(R"({"Tuple": [4, 1]})"));
    EXPECT_EQ(types[8]["type"]["def"], json::parse(R"({"Compact": {"inner": 2}})"));
    EXPECT_EQ(types[9]["type"]["def"], json::parse(R"({"BitSequence": {"bit_store": 0, "bit_order": 4}})"));

    const json& account = types[4]["type"];
    EXPECT_EQ(account["path"], json::parse(R"(["sp_core", "crypto", "AccountId32"])"));
    EXPECT_EQ(account["def"]["Composite"]["fields"][0],
              json::parse(R"({"name": null, "ty": 3, "type_name": "[u8; 32]", "docs": []})"));

    const json& call = types[5]["type"]["def"]["Variant"]["variants"];
    EXPECT_EQ(call[0]["name"], "transfer");
    EXPECT_EQ(call[0]["fields"][1]["ty"], 8);
    EXPECT_EQ(call[1]["index"], 1);
}

// =============================================================================
// Tree Projection Tests
// =============================================================================

TEST_F(JsonTest, BalancesEnvelope) {
    json out = to_json(wrap(test::balances_v16()));

    EXPECT_EQ(out["magic"], kMetadataMagic);
    ASSERT_TRUE(out["metadata"].contains("V16"));
    const json& tree = out["metadata"]["V16"];

    EXPECT_EQ(tree["types"][0]["type"]["def"]["Primitive"], "u128");

    const json& pallet = tree["pallets"][0];
    EXPECT_EQ(pallet["name"], "Balances");
    EXPECT_EQ(pallet["index"], 5);
    EXPECT_TRUE(pallet["calls"].is_null());
    EXPECT_EQ(pallet["deprecation_info"], "NotDeprecated");

    const json& entry = pallet["storage"]["entries"][0];
    EXPECT_EQ(entry["name"], "TotalIssuance");
    EXPECT_EQ(entry["modifier"], "Default");
    EXPECT_EQ(entry["ty"], json::parse(R"({"Plain": 0})"));
    EXPECT_EQ(entry["default"], "0x" + std::string(32, '0'));

    EXPECT_TRUE(tree["extrinsic"]["address_ty"].is_null());
    EXPECT_TRUE(tree["outer_enums"]["call_enum_ty"].is_null());
    EXPECT_EQ(tree["custom"], json::parse(R"({"map": {}})"));
    EXPECT_FALSE(tree.contains("ty"));
}

TEST_F(JsonTest, CurrentVersionDeprecationAndExtensions) {
    json tree = to_json(test::sample_v16());
    const json& balances = tree["pallets"][1];

    EXPECT_EQ(balances["calls"]["deprecation_info"],
              json::parse(R"({"VariantsDeprecated": {"1": {"Deprecated": {"note": "use transfer", "since": "1.2.0"}}}})"));
    EXPECT_EQ(balances["event"]["deprecation_info"], json::parse(R"({"ItemDeprecated": "DeprecatedWithoutNote"})"));
    EXPECT_EQ(balances["error"]["deprecation_info"], "NotDeprecated");
    EXPECT_EQ(balances["storage"]["entries"][1]["deprecation_info"], "DeprecatedWithoutNote");
    EXPECT_EQ(balances["storage"]["entries"][2]["ty"],
              json::parse(R"({"Map": {"hashers": ["Blake2_128Concat", "Twox64Concat"], "key": 6, "value": 1}})"));

    const json& view = balances["view_functions"][0];
    EXPECT_EQ(view["id"].get<std::string>().substr(0, 8), "0x000102");
    EXPECT_EQ(view["deprecation_info"],
              json::parse(R"({"Deprecated": {"note": "query the account instead", "since": null}})"));

    const json& extrinsic = tree["extrinsic"];
    EXPECT_EQ(extrinsic["versions"], json::parse("[4, 5]"));
    EXPECT_EQ(extrinsic["transaction_extensions_by_version"], json::parse(R"({"0": [0, 1], "1": [1]})"));
    EXPECT_EQ(extrinsic["transaction_extensions"][1],
              json::parse(R"({"identifier": "CheckWeight", "ty": 6, "implicit": 7})"));

    EXPECT_EQ(tree["apis"][0]["version"], 5);
    EXPECT_TRUE(tree["outer_enums"]["error_enum_ty"].is_null());
    EXPECT_EQ(tree["custom"]["map"]["ss58_prefix"], json::parse(R"({"ty": 1, "value": "0x2a000000"})"));
}

TEST_F(JsonTest, OlderRegistryBackedVersionsKeepTheirSlots) {
    json v14 = to_json(test::sample_v14());
    EXPECT_EQ(v14["ty"], 10);
    EXPECT_EQ(v14["extrinsic"]["ty"], 6);
    EXPECT_EQ(v14["extrinsic"]["signed_extensions"][0],
              json::parse(R"({"identifier": "CheckNonce", "ty": 1, "additional_signed": 5})"));
    EXPECT_FALSE(v14.contains("apis"));

    json v15 = to_json(test::sample_v15());
    EXPECT_EQ(v15["extrinsic"]["extra_ty"], 5);
    EXPECT_EQ(v15["outer_enums"]["event_enum_ty"], 2);
    EXPECT_EQ(v15["apis"][0]["methods"][0]["inputs"][0], json::parse(R"({"name": "account", "ty": 3})"));
    EXPECT_EQ(v15["pallets"][1]["docs"][0], " The balances pallet.");
}

TEST_F(JsonTest, LegacyStorageShapes) {
    json tree = to_json(test::sample_legacy<12>());
    const json& entries = tree["modules"][0]["storage"]["entries"];

    EXPECT_EQ(entries[0]["ty"]["Map"]["keys"], json::parse(R"([{"hasher": "Blake2_256", "key": "T::AccountId"}])"));
    EXPECT_EQ(entries[0]["ty"]["Map"]["is_linked"], false);
    EXPECT_EQ(entries[1]["ty"], json::parse(R"({"Plain": "T::BlockNumber"})"));

    const json& doubled = entries[2]["ty"]["DoubleMap"];
    EXPECT_EQ(doubled["keys"][0]["hasher"], "Blake2_128");
    EXPECT_EQ(doubled["keys"][1], json::parse(R"({"hasher": "Twox64Concat", "key": "T::Hash"})"));
    EXPECT_EQ(doubled["value"], "bool");
    EXPECT_FALSE(doubled.contains("is_linked"));

    const json& timestamp = tree["modules"][1];
    EXPECT_EQ(timestamp["index"], 3);
    EXPECT_TRUE(timestamp["storage"].is_null());
    EXPECT_EQ(timestamp["calls"], json::array());
    EXPECT_TRUE(timestamp["event"].is_null());
    EXPECT_EQ(tree["extrinsic"]["signed_extensions"], json::parse(R"(["CheckNonce", "CheckWeight"])"));
}

TEST_F(JsonTest, EarlyLegacyVersionsOmitLaterFields) {
    json tree = to_json(test::sample_legacy<10>());
    EXPECT_FALSE(tree.contains("extrinsic"));
    EXPECT_FALSE(tree["modules"][0].contains("index"));
    EXPECT_EQ(tree["modules"][0]["constants"][0]["value"], "0x60090000");

    json tagged = to_json(RuntimeMetadata(test::sample_legacy<10>()));
    EXPECT_TRUE(tagged.contains("V10"));
}

// =============================================================================
// Error and Text Tests
// =============================================================================

TEST_F(JsonTest, DecodeErrorProjection) {
    std::vector<uint8_t> bytes = {0x6d, 0x65, 0x74, 0x61, 0x10};
    auto decoded = decode(bytes);
    ASSERT_TRUE(decoded.is_err());

    json out = to_json(decoded.error());
    EXPECT_EQ(out["kind"], "MalformedPayload");
    EXPECT_EQ(out["version"], 16);
    EXPECT_EQ(out["offset"], 5);
    EXPECT_FALSE(out.contains("type_id"));
    EXPECT_FALSE(out["message"].get<std::string>().empty());
}

TEST_F(JsonTest, DanglingErrorProjection) {
    auto tree = test::sample_v16();
    tree.pallets[1].calls->ty = TypeId{77};
    auto checked = tree.validate();
    ASSERT_TRUE(checked.is_err());

    json out = to_json(checked.error());
    EXPECT_EQ(out["kind"], "DanglingTypeReference");
    EXPECT_EQ(out["type_id"], 77);
    EXPECT_EQ(out["field_path"], "pallets[Balances].calls.ty");
    EXPECT_FALSE(out.contains("offset"));
}

TEST_F(JsonTest, TextFormParsesBack) {
    auto prefixed = wrap(test::sample_v16());
    std::string text = to_json_string(prefixed);
    EXPECT_NE(text.find("\n  "), std::string::npos);
    EXPECT_EQ(json::parse(text), to_json(prefixed));

    std::string compact = to_json_string(prefixed, -1);
    EXPECT_EQ(compact.find('\n'), std::string::npos);
    EXPECT_EQ(json::parse(compact), to_json(prefixed));
}

} // namespace
} // namespace ChainMeta
