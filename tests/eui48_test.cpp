#include <gtest/gtest.h>
#include <ieeeid.hpp>

using namespace ieeeid;

class Eui48Test : public ::testing::Test {
protected:
    static constexpr Eui48::bytes_type sample{0x00, 0x1B, 0x63, 0x84, 0x45, 0xE6};
};

// ==============================================================================
// Raw construction
// ==============================================================================

TEST_F(Eui48Test, FromBytesKeepsEveryBit) {
    Eui48 eui(sample);
    EXPECT_EQ(eui.bytes(), sample);
    EXPECT_TRUE(eui.is_unicast());
    EXPECT_TRUE(eui.is_global());
    EXPECT_TRUE(eui.is_valid());

    Eui48 local({0x03, 0x1B, 0x63, 0x84, 0x45, 0xE6});
    EXPECT_EQ(local.bytes()[0], 0x03);
    EXPECT_TRUE(local.is_local());
    EXPECT_TRUE(local.is_multicast());
}

TEST_F(Eui48Test, Multicast) {
    Eui48 eui({0x01, 0x00, 0x5E, 0x00, 0x00, 0x01});
    EXPECT_TRUE(eui.is_multicast());
    EXPECT_FALSE(eui.is_unicast());
    EXPECT_EQ(eui.broadcast_scope(), BroadcastScope::multicast);
}

TEST_F(Eui48Test, BroadcastFillIsInvalid) {
    Eui48 eui({0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF});
    EXPECT_FALSE(eui.is_valid());
}

TEST_F(Eui48Test, Lengths) {
    EXPECT_EQ(Eui48::byte_length, 6u);
    EXPECT_EQ(Eui48::bit_length, 48u);
    EXPECT_EQ(Eui48::max_text_length, 17u);
}

// ==============================================================================
// Text construction
// ==============================================================================

TEST_F(Eui48Test, FromColonText) {
    Eui48 eui("00:1B:63:84:45:E6");
    EXPECT_EQ(eui.bytes(), sample);
    EXPECT_EQ(eui.to_colon_hex(), "00:1B:63:84:45:E6");
    EXPECT_EQ(eui.to_dash_hex(), "00-1B-63-84-45-E6");
}

TEST_F(Eui48Test, FromDashLowercaseText) {
    EXPECT_EQ(Eui48("00-1b-63-84-45-e6"), Eui48(sample));
}

TEST_F(Eui48Test, FromUndelimitedText) {
    EXPECT_EQ(Eui48("001B638445E6"), Eui48(sample));
}

TEST_F(Eui48Test, LocalRegistrationInTextYieldsZero) {
    Eui48 eui("02:1B:63:84:45:E6");
    EXPECT_EQ(eui, Eui48::zero());
    EXPECT_FALSE(eui.is_valid());
}

TEST_F(Eui48Test, ShortTextYieldsZero) {
    EXPECT_EQ(Eui48("00:1B:63:84:45"), Eui48::zero());
}

TEST_F(Eui48Test, LongTextYieldsZero) {
    EXPECT_EQ(Eui48("00:1B:63:84:45:E6:01"), Eui48::zero());
}

// ==============================================================================
// Composite construction
// ==============================================================================

TEST_F(Eui48Test, FromOui24) {
    Eui48 eui(Oui24({0x00, 0x1B, 0x63}), {0x84, 0x45, 0xE6});
    EXPECT_EQ(eui.bytes(), sample);
}

TEST_F(Eui48Test, FromMacBlockLarge) {
    Eui48 eui(MaL("00:1B:63"), {0x84, 0x45, 0xE6});
    EXPECT_EQ(eui.bytes(), sample);
}

TEST_F(Eui48Test, FromOui36MergesNibble) {
    Oui36 oui({0x70, 0xB3, 0xD5, 0x00, 0x10});
    Eui48 eui(oui, 0x0C, 0xDE);
    EXPECT_EQ(eui.bytes(), (Eui48::bytes_type{0x70, 0xB3, 0xD5, 0x00, 0x1C, 0xDE}));
}

TEST_F(Eui48Test, FromMacBlockMediumMergesNibble) {
    MaM block({0x10, 0x20, 0x30, 0x40});
    Eui48 eui(block, 0x0A, {0xBB, 0xCC});
    EXPECT_EQ(eui.bytes()[3], 0x4A);
    EXPECT_EQ(eui.bytes(), (Eui48::bytes_type{0x10, 0x20, 0x30, 0x4A, 0xBB, 0xCC}));
}

TEST_F(Eui48Test, FromMacBlockSmallIgnoresHighNibbleOfExtension) {
    MaS block({0x70, 0xB3, 0xD5, 0x12, 0x30});
    Eui48 eui(block, 0xF5, 0x67);
    EXPECT_EQ(eui.bytes(), (Eui48::bytes_type{0x70, 0xB3, 0xD5, 0x12, 0x35, 0x67}));
}

TEST_F(Eui48Test, CompositePreservesBlockBits) {
    Eui48 eui(MaL({0x02, 0x00, 0x00}), {0x00, 0x00, 0x01});
    EXPECT_TRUE(eui.is_global());
}
