#include <ieeeid/detail/hex_codec.hpp>

#include <string>
#include <vector>

#include <cstdint>
#include <gtest/gtest.h>

using namespace ieeeid::detail;

// ==============================================================================
// Rendering
// ==============================================================================

TEST(HexCodecTest, ByteToHexIsUppercaseTwoDigits) {
    EXPECT_EQ(byte_to_hex(0x00), "00");
    EXPECT_EQ(byte_to_hex(0x0F), "0F");
    EXPECT_EQ(byte_to_hex(0xAB), "AB");
    EXPECT_EQ(byte_to_hex(0xFF), "FF");
}

TEST(HexCodecTest, ByteToHexIsTotal) {
    for (unsigned value = 0; value <= 0xFF; ++value) {
        const auto b = static_cast<uint8_t>(value);
        const auto text = byte_to_hex(b);
        ASSERT_EQ(text.size(), 2u);
        ASSERT_EQ(hex_pair_to_byte(text), b);
    }
}

TEST(HexCodecTest, JoinHex) {
    const std::vector<uint8_t> bytes{0x0A, 0xB0, 0x01};
    EXPECT_EQ(join_hex(bytes, ':'), "0A:B0:01");
    EXPECT_EQ(join_hex(bytes, '-'), "0A-B0-01");
    EXPECT_EQ(join_hex(std::vector<uint8_t>{}, ':'), "");
}

// ==============================================================================
// Decoding
// ==============================================================================

TEST(HexCodecTest, HexPairToByteIsCaseInsensitive) {
    EXPECT_EQ(hex_pair_to_byte("ab"), 0xAB);
    EXPECT_EQ(hex_pair_to_byte("AB"), 0xAB);
    EXPECT_EQ(hex_pair_to_byte("fF"), 0xFF);
    EXPECT_EQ(hex_pair_to_byte("09"), 0x09);
}

TEST(HexCodecTest, IsHexDigit) {
    EXPECT_TRUE(is_hex_digit('0'));
    EXPECT_TRUE(is_hex_digit('9'));
    EXPECT_TRUE(is_hex_digit('a'));
    EXPECT_TRUE(is_hex_digit('F'));
    EXPECT_FALSE(is_hex_digit('g'));
    EXPECT_FALSE(is_hex_digit(':'));
    EXPECT_FALSE(is_hex_digit('-'));
    EXPECT_FALSE(is_hex_digit(' '));
}

TEST(HexCodecTest, ExtractColonDelimited) {
    EXPECT_EQ(extract_bytes("00:1B:63:84:45:E6"),
              (std::vector<uint8_t>{0x00, 0x1B, 0x63, 0x84, 0x45, 0xE6}));
}

TEST(HexCodecTest, ExtractDashDelimitedLowercase) {
    EXPECT_EQ(extract_bytes("00-1b-63"), (std::vector<uint8_t>{0x00, 0x1B, 0x63}));
}

TEST(HexCodecTest, ExtractUndelimited) {
    EXPECT_EQ(extract_bytes("001B63"), (std::vector<uint8_t>{0x00, 0x1B, 0x63}));
}

TEST(HexCodecTest, ExtractIgnoresArbitraryNoise) {
    EXPECT_EQ(extract_bytes(" 00.1B zz 63 "), (std::vector<uint8_t>{0x00, 0x1B, 0x63}));
}

TEST(HexCodecTest, ExtractConsumesPairsTwoAtATime) {
    // "123" yields 0x12; the trailing '3' has no partner
    EXPECT_EQ(extract_bytes("123"), (std::vector<uint8_t>{0x12}));
}

TEST(HexCodecTest, ExtractDropsTrailingSingleDigit) {
    EXPECT_EQ(extract_bytes("12:34:56:1"), (std::vector<uint8_t>{0x12, 0x34, 0x56}));
}

TEST(HexCodecTest, ExtractSkipsUnpairedLeadingDigit) {
    EXPECT_EQ(extract_bytes("1:23"), (std::vector<uint8_t>{0x23}));
}

TEST(HexCodecTest, ExtractWithoutHexPairsIsEmpty) {
    EXPECT_TRUE(extract_bytes("").empty());
    EXPECT_TRUE(extract_bytes("::--").empty());
    EXPECT_TRUE(extract_bytes("G1 2H").empty());
}

TEST(HexCodecTest, ExtractIsPure) {
    const std::string text = "AA:BB:CC";
    EXPECT_EQ(extract_bytes(text), extract_bytes(text));
}
