#include "common/text_encoding.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

TEST(Base32Test, EncodesRfc4648VectorsLowercaseWithoutPadding) {
    EXPECT_EQ(base32_encode(bytes_of("")), "");
    EXPECT_EQ(base32_encode(bytes_of("f")), "my");
    EXPECT_EQ(base32_encode(bytes_of("fo")), "mzxq");
    EXPECT_EQ(base32_encode(bytes_of("foobar")), "mzxw6ytboi");
}

TEST(Base32Test, DecodesEitherCase) {
    auto lower = base32_decode("mzxw6ytboi");
    auto upper = base32_decode("MZXW6YTBOI");
    ASSERT_TRUE(lower.has_value());
    ASSERT_TRUE(upper.has_value());
    EXPECT_EQ(*lower, bytes_of("foobar"));
    EXPECT_EQ(*upper, bytes_of("foobar"));
}

TEST(Base32Test, RejectsBadCharactersAndLengths) {
    EXPECT_FALSE(base32_decode("mzx1").has_value());   // '1' is not in the alphabet
    EXPECT_FALSE(base32_decode("m").has_value());      // 5 bits cannot form a byte
    EXPECT_FALSE(base32_decode("mzx").has_value());    // 15 bits leaves 7 over
    EXPECT_FALSE(base32_decode("my==").has_value());   // padding is not accepted
}

TEST(Base32Test, RejectsNonZeroTrailingBits) {
    EXPECT_TRUE(base32_decode("my").has_value());
    EXPECT_FALSE(base32_decode("mz").has_value());
}

TEST(Base32Test, LengthForHashSizes) {
    EXPECT_EQ(base32_length(32), 52u);
    EXPECT_EQ(base32_length(33), 53u);
}

TEST(HexTest, RoundTripsAndRejectsGarbage) {
    std::vector<uint8_t> data = {0xde, 0xad, 0xbe, 0xef};
    EXPECT_EQ(hex_encode(data), "deadbeef");

    auto decoded = hex_decode("DEADbeef");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, data);

    EXPECT_FALSE(hex_decode("abc").has_value());
    EXPECT_FALSE(hex_decode("zz").has_value());
}

} // namespace
