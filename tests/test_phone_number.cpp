// =============================================================================
// FILE: tests/test_phone_number.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "common/phone_number.h"
#include "common/ids.h"

using namespace turbo_dialer;

TEST(PhoneNumber, TenDigitsAreNanp) {
    EXPECT_EQ(normalize_e164("(512) 555-0100"), "+15125550100");
    EXPECT_EQ(normalize_e164("512.555.0100"), "+15125550100");
}

TEST(PhoneNumber, ElevenDigitsWithCountryCode) {
    EXPECT_EQ(normalize_e164("1-512-555-0100"), "+15125550100");
    EXPECT_EQ(normalize_e164("+1 512 555 0100"), "+15125550100");
}

TEST(PhoneNumber, InternationalKeepsDigits) {
    EXPECT_EQ(normalize_e164("+44 20 7946 0958"), "+442079460958");
}

TEST(PhoneNumber, TooShortIsRejected) {
    EXPECT_EQ(normalize_e164(""), "");
    EXPECT_EQ(normalize_e164("555-01"), "");
    EXPECT_EQ(normalize_e164("call me"), "");
}

TEST(PhoneNumber, AreaCode) {
    EXPECT_EQ(nanp_area_code("+15125550100"), "512");
    EXPECT_EQ(nanp_area_code("+442079460958"), "");
    EXPECT_EQ(nanp_area_code("5125550100"), "");
}

TEST(Ids, UuidShapeAndUniqueness) {
    std::string a = generate_uuid();
    std::string b = generate_uuid();
    EXPECT_EQ(a.size(), 36u);
    EXPECT_EQ(a[8], '-');
    EXPECT_EQ(a[14], '4');
    EXPECT_NE(a, b);
}

TEST(Ids, ConferenceName) {
    EXPECT_EQ(make_conference_name("org1", "rep7", 1700000000123),
              "turbo-org1-rep7-1700000000123");
}
