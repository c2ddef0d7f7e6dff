#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "chainmeta/chainmeta.h"
#include "tests/test_support.h"

namespace ChainMeta {
namespace {

using test::wrap;

class EnvelopeTest : public ::testing::Test {
protected:
    static std::vector<uint8_t> header(uint8_t tag) {
        return {0x6d, 0x65, 0x74, 0x61, tag};
    }
};

// =============================================================================
// Header Tests
// =============================================================================

TEST_F(EnvelopeTest, EmptyCurrentVersionBytes) {
    RuntimeMetadataPrefixed empty;
    EXPECT_EQ(empty.version(), kCurrentVersion);

    auto bytes = encode(empty);
    ASSERT_TRUE(bytes.is_ok()) << bytes.error().to_string();

    const std::vector<uint8_t> unspecified = {0x03, 0xff, 0xff, 0xff, 0xff};
    std::vector<uint8_t> expected = header(0x10);
    expected.push_back(0x00);  // types
    expected.push_back(0x00);  // pallets
    expected.push_back(0x00);  // extrinsic versions
    expected.insert(expected.end(), unspecified.begin(), unspecified.end());  // address
    expected.insert(expected.end(), unspecified.begin(), unspecified.end());  // signature
    expected.push_back(0x00);  // extensions by version
    expected.push_back(0x00);  // extensions
    expected.push_back(0x00);  // apis
    for (int i = 0; i < 3; ++i) {
        expected.insert(expected.end(), unspecified.begin(), unspecified.end());
    }
    expected.push_back(0x00);  // custom

    EXPECT_EQ(bytes.value().size(), 37u);
    EXPECT_EQ(bytes.value(), expected);

    auto decoded = decode(bytes.value());
    ASSERT_TRUE(decoded.is_ok()) << decoded.error().to_string();
    EXPECT_EQ(decoded.value(), empty);
}

TEST_F(EnvelopeTest, WrongMagicIsBadMagic) {
    std::vector<uint8_t> bytes = {0x00, 0x00, 0x00, 0x00, 0x10};
    auto decoded = decode(bytes);
    ASSERT_TRUE(decoded.is_err());
    EXPECT_EQ(decoded.error().kind, MetadataErrorKind::BadMagic);

    auto version = version_of(bytes);
    ASSERT_TRUE(version.is_err());
    EXPECT_EQ(version.error().kind, MetadataErrorKind::BadMagic);
}

TEST_F(EnvelopeTest, AnyFlippedMagicBitIsBadMagic) {
    auto bytes = encode(wrap(test::sample_v14()));
    ASSERT_TRUE(bytes.is_ok());

    for (size_t i = 0; i < 4; ++i) {
        for (int bit = 0; bit < 8; ++bit) {
            auto flipped = bytes.value();
            flipped[i] ^= static_cast<uint8_t>(1u << bit);
            auto decoded = decode(flipped);
            ASSERT_TRUE(decoded.is_err()) << "byte " << i << " bit " << bit;
            EXPECT_EQ(decoded.error().kind, MetadataErrorKind::BadMagic) << "byte " << i << " bit " << bit;
        }
    }
}

TEST_F(EnvelopeTest, ShortInputs) {
    auto empty = decode(std::vector<uint8_t>{});
    ASSERT_TRUE(empty.is_err());
    EXPECT_EQ(empty.error().kind, MetadataErrorKind::MalformedPayload);

    auto partial_magic = decode(std::vector<uint8_t>{0x6d, 0x65});
    ASSERT_TRUE(partial_magic.is_err());
    EXPECT_EQ(partial_magic.error().kind, MetadataErrorKind::MalformedPayload);

    auto foreign = decode(std::vector<uint8_t>{0x7b, 0x22});
    ASSERT_TRUE(foreign.is_err());
    EXPECT_EQ(foreign.error().kind, MetadataErrorKind::BadMagic);

    auto magic_only = decode(std::vector<uint8_t>{0x6d, 0x65, 0x74, 0x61});
    ASSERT_TRUE(magic_only.is_err());
    EXPECT_EQ(magic_only.error().kind, MetadataErrorKind::MalformedPayload);
    EXPECT_EQ(magic_only.error().offset, 4u);
}

TEST_F(EnvelopeTest, UnsupportedTagsAreReportedWithTheTag) {
    const std::vector<uint8_t> tags = {0, 1, 2, 3, 4, 5, 6, 7, 17, 255};
    for (uint8_t tag : tags) {
        auto decoded = decode(header(tag));
        ASSERT_TRUE(decoded.is_err()) << static_cast<int>(tag);
        EXPECT_EQ(decoded.error().kind, MetadataErrorKind::UnsupportedVersion);
        EXPECT_EQ(decoded.error().version, tag);

        auto version = version_of(header(tag));
        ASSERT_TRUE(version.is_ok());
        EXPECT_EQ(version.value(), tag);
    }
}

TEST_F(EnvelopeTest, SupportedVersionsAreEightToSixteen) {
    EXPECT_EQ(supported_versions(), (std::vector<uint8_t>{8, 9, 10, 11, 12, 13, 14, 15, 16}));
    EXPECT_TRUE(is_supported_version(8));
    EXPECT_TRUE(is_supported_version(16));
    EXPECT_FALSE(is_supported_version(7));
    EXPECT_FALSE(is_supported_version(17));
}

// =============================================================================
// Payload Tests
// =============================================================================

TEST_F(EnvelopeTest, EveryTruncationIsMalformed) {
    auto bytes = encode(wrap(test::sample_v16()));
    ASSERT_TRUE(bytes.is_ok());
    const auto& full = bytes.value();

    for (size_t len = 0; len < full.size(); ++len) {
        std::vector<uint8_t> prefix(full.begin(), full.begin() + static_cast<std::ptrdiff_t>(len));
        auto decoded = decode(prefix);
        ASSERT_TRUE(decoded.is_err()) << "prefix of " << len << " bytes decoded";
        EXPECT_EQ(decoded.error().kind, MetadataErrorKind::MalformedPayload) << len;
    }
}

TEST_F(EnvelopeTest, TruncatedPayloadCarriesVersionAndOffset) {
    auto decoded = decode(header(0x10));
    ASSERT_TRUE(decoded.is_err());
    EXPECT_EQ(decoded.error().kind, MetadataErrorKind::MalformedPayload);
    EXPECT_EQ(decoded.error().version, 16);
    EXPECT_EQ(decoded.error().offset, 5u);
}

TEST_F(EnvelopeTest, TrailingByteIsMalformed) {
    auto bytes = encode(wrap(test::sample_v14()));
    ASSERT_TRUE(bytes.is_ok());
    auto padded = bytes.value();
    padded.push_back(0x00);

    auto decoded = decode(padded);
    ASSERT_TRUE(decoded.is_err());
    EXPECT_EQ(decoded.error().kind, MetadataErrorKind::MalformedPayload);
    EXPECT_EQ(decoded.error().offset, bytes.value().size());
}

TEST_F(EnvelopeTest, InvalidUtf8NameIsMalformed) {
    std::vector<uint8_t> bytes = header(0x10);
    bytes.push_back(0x00);  // types
    bytes.push_back(0x04);  // one pallet
    bytes.insert(bytes.end(), {0x08, 0xff, 0xfe});

    auto decoded = decode(bytes);
    ASSERT_TRUE(decoded.is_err());
    EXPECT_EQ(decoded.error().kind, MetadataErrorKind::MalformedPayload);
    EXPECT_EQ(decoded.error().field_path, "pallets[0].name");
    EXPECT_EQ(decoded.error().offset, 7u);

    auto tree = test::sample_v16();
    tree.pallets[0].name = "\xff\xfe";
    auto encoded = encode(wrap(tree));
    ASSERT_TRUE(encoded.is_err());
    EXPECT_EQ(encoded.error().kind, MetadataErrorKind::MalformedPayload);
}

TEST_F(EnvelopeTest, OversizedPalletCountIsMalformed) {
    // 2^20 pallets claimed, 2^20 bytes that cannot start a pallet
    std::vector<uint8_t> bytes = header(0x10);
    bytes.push_back(0x00);
    bytes.insert(bytes.end(), {0x02, 0x00, 0x40, 0x00});
    bytes.resize(bytes.size() + (1u << 20), 0xff);

    auto decoded = decode(bytes);
    ASSERT_TRUE(decoded.is_err());
    EXPECT_EQ(decoded.error().kind, MetadataErrorKind::MalformedPayload);
    EXPECT_EQ(decoded.error().version, 16);
    EXPECT_EQ(decoded.error().field_path, "pallets[0].name");
    EXPECT_EQ(decoded.error().offset, 10u);
}

TEST_F(EnvelopeTest, TagSelectsTheSchema) {
    auto bytes = encode(wrap(test::sample_legacy<8>()));
    ASSERT_TRUE(bytes.is_ok());
    EXPECT_EQ(bytes.value()[4], 8);

    auto decoded = decode(bytes.value());
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_TRUE(std::holds_alternative<v8::RuntimeMetadataV8>(decoded.value().metadata));
    EXPECT_EQ(decoded.value().types(), nullptr);

    auto modern = decode(encode(wrap(test::sample_v15())).value());
    ASSERT_TRUE(modern.is_ok());
    EXPECT_EQ(modern.value().version(), 15);
    ASSERT_NE(modern.value().types(), nullptr);
    EXPECT_EQ(modern.value().types()->size(), 11u);
}

TEST_F(EnvelopeTest, EncodeRejectsForeignMagic) {
    RuntimeMetadataPrefixed prefixed;
    prefixed.magic = 0x12345678;
    auto bytes = encode(prefixed);
    ASSERT_TRUE(bytes.is_err());
    EXPECT_EQ(bytes.error().kind, MetadataErrorKind::BadMagic);
}

TEST_F(EnvelopeTest, DanglingReferenceFailsDecodeWithVersion) {
    auto tree = test::sample_v16();
    tree.pallets[1].calls->ty = TypeId{77};

    auto decoded = decode(test::encode_unchecked(tree));
    ASSERT_TRUE(decoded.is_err());
    EXPECT_EQ(decoded.error().kind, MetadataErrorKind::DanglingTypeReference);
    EXPECT_EQ(decoded.error().version, 16);
    EXPECT_EQ(decoded.error().type_id, 77u);
}

// =============================================================================
// Opaque Form Tests
// =============================================================================

TEST_F(EnvelopeTest, OpaqueFormWrapsTheEnvelope) {
    auto prefixed = wrap(test::sample_v16());
    auto opaque = to_opaque(prefixed);
    ASSERT_TRUE(opaque.is_ok());

    auto envelope = encode(prefixed);
    ASSERT_TRUE(envelope.is_ok());
    EXPECT_EQ(opaque.value().bytes, envelope.value());

    auto wire = scale::to_bytes(opaque.value());
    EXPECT_GT(wire.size(), envelope.value().size());

    auto decoded = decode_opaque(wire);
    ASSERT_TRUE(decoded.is_ok()) << decoded.error().to_string();
    EXPECT_EQ(decoded.value(), prefixed);

    auto direct = from_opaque(opaque.value());
    ASSERT_TRUE(direct.is_ok());
    EXPECT_EQ(direct.value(), prefixed);
}

TEST_F(EnvelopeTest, OpaqueLengthBeyondInputIsMalformed) {
    std::vector<uint8_t> wire = {0x14, 0x6d, 0x65};
    auto decoded = decode_opaque(wire);
    ASSERT_TRUE(decoded.is_err());
    EXPECT_EQ(decoded.error().kind, MetadataErrorKind::MalformedPayload);
    EXPECT_EQ(decoded.error().offset, 0u);
}

} // namespace
} // namespace ChainMeta
