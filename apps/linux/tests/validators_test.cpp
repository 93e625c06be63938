#include "validators.h"
#include <gtest/gtest.h>

TEST(Ipv4, AcceptsDottedQuads) {
    EXPECT_TRUE(is_valid_ipv4("192.168.1.238"));
    EXPECT_TRUE(is_valid_ipv4("10.0.0.5"));
    EXPECT_TRUE(is_valid_ipv4("0.0.0.0"));
    EXPECT_TRUE(is_valid_ipv4("255.255.255.255"));
    EXPECT_TRUE(is_valid_ipv4("010.001.000.009"));
}

TEST(Ipv4, RejectsOutOfRangeOctets) {
    EXPECT_FALSE(is_valid_ipv4("256.1.1.1"));
    EXPECT_FALSE(is_valid_ipv4("1.1.1.300"));
}

TEST(Ipv4, RejectsMalformed) {
    EXPECT_FALSE(is_valid_ipv4(""));
    EXPECT_FALSE(is_valid_ipv4("not-an-ip"));
    EXPECT_FALSE(is_valid_ipv4("1.2.3"));
    EXPECT_FALSE(is_valid_ipv4("1.2.3.4.5"));
    EXPECT_FALSE(is_valid_ipv4("1..3.4"));
    EXPECT_FALSE(is_valid_ipv4("1.2.3.4."));
    EXPECT_FALSE(is_valid_ipv4("-1.2.3.4"));
    EXPECT_FALSE(is_valid_ipv4("1.2.3.a"));
    EXPECT_FALSE(is_valid_ipv4(" 1.2.3.4"));
}

TEST(Ipv4, LeadingZerosAreDecimal) {
    std::string canonical;
    ASSERT_TRUE(parse_ipv4("010.0.0.5", canonical));
    EXPECT_EQ(canonical, "10.0.0.5");
    ASSERT_TRUE(parse_ipv4("192.168.001.238", canonical));
    EXPECT_EQ(canonical, "192.168.1.238");
    ASSERT_TRUE(parse_ipv4("000.000.000.000", canonical));
    EXPECT_EQ(canonical, "0.0.0.0");
}

TEST(Ipv4, InvalidInputLeavesOutputAlone) {
    std::string canonical = "unchanged";
    EXPECT_FALSE(parse_ipv4("010.0.0.256", canonical));
    EXPECT_FALSE(parse_ipv4("10.0.0", canonical));
    EXPECT_EQ(canonical, "unchanged");
}

TEST(Pin, NormalizesCaseAndWhitespace) {
    EXPECT_EQ(normalize_pin("  4d292b \n"), "4D292B");
    EXPECT_EQ(normalize_pin("ABCDEF"), "ABCDEF");
}

TEST(Pin, AcceptsSixHexChars) {
    EXPECT_TRUE(is_valid_pin("4D292B"));
    EXPECT_TRUE(is_valid_pin("4d292b"));
    EXPECT_TRUE(is_valid_pin("000000"));
}

TEST(Pin, RejectsWrongLengthOrAlphabet) {
    EXPECT_FALSE(is_valid_pin(""));
    EXPECT_FALSE(is_valid_pin("4D292"));
    EXPECT_FALSE(is_valid_pin("4D292BA"));
    EXPECT_FALSE(is_valid_pin("4D292G"));
    EXPECT_FALSE(is_valid_pin("12 456"));
}

TEST(Trim, StripsBothEnds) {
    EXPECT_EQ(trim("\t a b \r\n"), "a b");
    EXPECT_EQ(trim("   "), "");
}
