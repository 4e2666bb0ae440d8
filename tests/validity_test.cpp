#include <gtest/gtest.h>
#include <ieeeid.hpp>

using namespace ieeeid;

template <typename T>
class ValidityTest : public ::testing::Test {
protected:
    // Distinct octets 0x10, 0x21, 0x32, ... survive every kind's bit forcing
    static typename T::bytes_type staircase() {
        typename T::bytes_type raw{};
        for (std::size_t i = 0; i < raw.size(); ++i) {
            raw[i] = static_cast<uint8_t>(0x10 + i * 0x11);
        }
        return raw;
    }
};

using AllKinds = ::testing::Types<CompanyId, Oui24, Oui36, MacBlockLarge, MacBlockMedium,
                                  MacBlockSmall, Eui48, Eui60, Eui64, ModifiedEui64, Cdi32, Cdi40>;
TYPED_TEST_SUITE(ValidityTest, AllKinds);

TYPED_TEST(ValidityTest, ZeroIsInvalid) {
    EXPECT_FALSE(TypeParam::zero().is_valid());
    EXPECT_EQ(TypeParam(), TypeParam::zero());
    EXPECT_EQ(TypeParam::zero().to_integer(), 0u);
}

TYPED_TEST(ValidityTest, DistinctOctetsAreValid) {
    TypeParam id(TestFixture::staircase());
    EXPECT_TRUE(id.is_valid());
}

TYPED_TEST(ValidityTest, EmptyTextYieldsZero) {
    TypeParam id("");
    EXPECT_EQ(id, TypeParam::zero());
    EXPECT_FALSE(id.is_valid());
}

TYPED_TEST(ValidityTest, TextLengthMatchesCanonicalForm) {
    TypeParam id(TestFixture::staircase());
    EXPECT_EQ(id.to_colon_hex().size(), TypeParam::max_text_length);
    EXPECT_EQ(id.to_dash_hex().size(), TypeParam::max_text_length);
}

// ==============================================================================
// Uniform fills
// ==============================================================================

TEST(ValidityTest, BroadcastFillsAreInvalid) {
    EXPECT_FALSE(Eui48({0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF}).is_valid());
    EXPECT_FALSE(Eui64({0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF}).is_valid());
    EXPECT_FALSE(Meui64({0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF}).is_valid());
    EXPECT_FALSE(CompanyId({0xFF, 0xFF, 0xFF}).is_valid());
}

TEST(ValidityTest, FillBrokenByForcingIsValid) {
    // Stored octets FD:FF:FF are no longer uniform
    Oui24 oui({0xFF, 0xFF, 0xFF});
    EXPECT_EQ(oui.to_colon_hex(), "FD:FF:FF");
    EXPECT_TRUE(oui.is_valid());
}

TEST(ValidityTest, RepeatedNonLeadingOctetsAreValid) {
    EXPECT_TRUE(CompanyId("12:34:56").is_valid());
    EXPECT_TRUE(Eui48({0x00, 0x00, 0x00, 0x00, 0x00, 0x01}).is_valid());
}
