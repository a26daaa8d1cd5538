#include "rup/protocol/tus.hpp"

#include <gtest/gtest.h>

#include <limits>

namespace tus = rup::protocol::tus;
using rup::protocol::ChecksumAlgorithm;
using rup::protocol::ChunkChecksum;

namespace {

std::string as_text(const std::vector<std::uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace

// ════════════════════════════════════════════════════════════
// base64
// ════════════════════════════════════════════════════════════

TEST(Base64Test, EncodesRfc4648Vectors) {
    EXPECT_EQ(tus::base64_encode(""), "");
    EXPECT_EQ(tus::base64_encode("f"), "Zg==");
    EXPECT_EQ(tus::base64_encode("fo"), "Zm8=");
    EXPECT_EQ(tus::base64_encode("foo"), "Zm9v");
    EXPECT_EQ(tus::base64_encode("foobar"), "Zm9vYmFy");
}

TEST(Base64Test, DecodesAndStripsPadding) {
    auto one = tus::base64_decode("Zg==");
    ASSERT_TRUE(one.has_value());
    EXPECT_EQ(as_text(*one), "f");

    auto two = tus::base64_decode("Zm8=");
    ASSERT_TRUE(two.has_value());
    EXPECT_EQ(as_text(*two), "fo");

    auto empty = tus::base64_decode("");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST(Base64Test, RejectsMalformedInput) {
    EXPECT_FALSE(tus::base64_decode("Zg").has_value());
    EXPECT_FALSE(tus::base64_decode("Z=g=").has_value());
    EXPECT_FALSE(tus::base64_decode("Zm9v YmFy").has_value());
    EXPECT_FALSE(tus::base64_decode("Zm9*").has_value());
}

TEST(Base64Test, HandlesBinaryBytes) {
    const std::vector<std::uint8_t> bytes = {0x00, 0xff, 0x10, 0x80, 0x7f};
    auto decoded = tus::base64_decode(tus::base64_encode(bytes.data(), bytes.size()));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, bytes);
}

// ════════════════════════════════════════════════════════════
// Upload-Metadata
// ════════════════════════════════════════════════════════════

TEST(MetadataTest, ParsesPairsAndKeyOnlyEntries) {
    auto parsed = tus::parse_metadata("filename Y2xpcC5tcDQ=, is_private,target_ref cG9zdC03");
    ASSERT_TRUE(parsed.is_ok()) << parsed.error();

    const auto& metadata = parsed.value();
    ASSERT_EQ(metadata.size(), 3u);
    EXPECT_EQ(metadata.at("filename"), "clip.mp4");
    EXPECT_EQ(metadata.at("is_private"), "");
    EXPECT_EQ(metadata.at("target_ref"), "post-7");
}

TEST(MetadataTest, EmptyHeaderIsEmptyMap) {
    auto parsed = tus::parse_metadata("   ");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_TRUE(parsed.value().empty());
}

TEST(MetadataTest, RejectsDuplicateKeys) {
    auto parsed = tus::parse_metadata("a Zg==,a Zm8=");
    ASSERT_TRUE(parsed.is_error());
    EXPECT_NE(parsed.error().find("Duplicate"), std::string::npos);
}

TEST(MetadataTest, RejectsEmptyEntriesAndBadValues) {
    EXPECT_TRUE(tus::parse_metadata("a Zg==,,b Zg==").is_error());
    EXPECT_TRUE(tus::parse_metadata("a Zg==,").is_error());
    EXPECT_TRUE(tus::parse_metadata("a not-base64").is_error());
}

TEST(MetadataTest, EncodeIsReadBack) {
    tus::Metadata metadata = {{"filename", "holiday video.mov"}, {"flag", ""}, {"target_ref", "album/42"}};
    const std::string header = tus::encode_metadata(metadata);
    EXPECT_EQ(header.find("flag "), std::string::npos);

    auto parsed = tus::parse_metadata(header);
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value(), metadata);
}

// ════════════════════════════════════════════════════════════
// Upload-Checksum
// ════════════════════════════════════════════════════════════

TEST(ChecksumHeaderTest, ParsesSupportedAlgorithms) {
    const std::vector<std::uint8_t> payload = {'a', 'b', 'c'};
    const auto digest = rup::protocol::compute_digest(ChecksumAlgorithm::Sha1, payload);

    auto parsed = tus::parse_checksum("sha1 " + tus::base64_encode(digest.data(), digest.size()));
    ASSERT_TRUE(parsed.is_ok()) << parsed.error();
    EXPECT_EQ(parsed.value().algorithm, ChecksumAlgorithm::Sha1);
    EXPECT_EQ(parsed.value().digest, digest);
    EXPECT_TRUE(parsed.value().matches(payload));
}

TEST(ChecksumHeaderTest, RejectsUnknownAlgorithmAndBadDigest) {
    EXPECT_TRUE(tus::parse_checksum("crc32 AAAAAA==").is_error());
    EXPECT_TRUE(tus::parse_checksum("sha256").is_error());
    EXPECT_TRUE(tus::parse_checksum("sha256 ***").is_error());
    EXPECT_TRUE(tus::parse_checksum("sha256 ").is_error());
}

TEST(ChecksumHeaderTest, FormatMatchesWireSyntax) {
    ChunkChecksum checksum{ChecksumAlgorithm::Md5, {0x01, 0x02, 0x03}};
    EXPECT_EQ(tus::format_checksum(checksum), "md5 AQID");
}

// ════════════════════════════════════════════════════════════
// Integers
// ════════════════════════════════════════════════════════════

TEST(ParseUintTest, AcceptsPlainDecimal) {
    EXPECT_EQ(tus::parse_uint("0").value_or(1), 0u);
    EXPECT_EQ(tus::parse_uint("10485760").value_or(0), 10485760u);
    EXPECT_EQ(tus::parse_uint("18446744073709551615").value_or(0), std::numeric_limits<std::uint64_t>::max());
}

TEST(ParseUintTest, RejectsSignsWhitespaceAndOverflow) {
    EXPECT_FALSE(tus::parse_uint("").has_value());
    EXPECT_FALSE(tus::parse_uint("-1").has_value());
    EXPECT_FALSE(tus::parse_uint("+1").has_value());
    EXPECT_FALSE(tus::parse_uint(" 1").has_value());
    EXPECT_FALSE(tus::parse_uint("1.5").has_value());
    EXPECT_FALSE(tus::parse_uint("18446744073709551616").has_value());
    EXPECT_FALSE(tus::parse_uint("999999999999999999999").has_value());
}
