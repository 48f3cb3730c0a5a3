#include <gtest/gtest.h>

#include "core/identity/PhoneNumber.hpp"

using mba::formatNumberToE164;

TEST(PhoneNumber, KeepsInternationalNumbers) {
  EXPECT_EQ(formatNumberToE164("+1 (201) 555-0123", "US"), "+12015550123");
  EXPECT_EQ(formatNumberToE164("+44 121 234 5678", ""), "+441212345678");
}

TEST(PhoneNumber, InternationalDialingPrefixIsUnderstood) {
  EXPECT_EQ(formatNumberToE164("0049 30 123456", "FR"), "+4930123456");
}

TEST(PhoneNumber, QualifiesNationalNumbers) {
  EXPECT_EQ(formatNumberToE164("201-555-0123", "us"), "+12015550123");
  EXPECT_EQ(formatNumberToE164("1 201 555 0123", "US"), "+12015550123");
  EXPECT_EQ(formatNumberToE164("0121 234 5678", "GB"), "+441212345678");
  EXPECT_EQ(formatNumberToE164("06 12 34 56 78", "FR"), "+33612345678");
}

TEST(PhoneNumber, RegionsWithoutTrunkPrefix) {
  EXPECT_EQ(formatNumberToE164("8123 4567", "SG"), "+6581234567");
  EXPECT_EQ(formatNumberToE164("2123 4567", "HK"), "+85221234567");
}

TEST(PhoneNumber, ItalianLeadingZeroIsKept) {
  EXPECT_EQ(formatNumberToE164("02 1234 5678", "IT"), "+390212345678");
}

TEST(PhoneNumber, RejectsUnusableInput) {
  EXPECT_FALSE(formatNumberToE164("", "US"));
  EXPECT_FALSE(formatNumberToE164("abc", "US"));
  EXPECT_FALSE(formatNumberToE164("2015550123", ""));
  EXPECT_FALSE(formatNumberToE164("2015550123", "XX"));
  EXPECT_FALSE(formatNumberToE164("+123", "US"));
}

TEST(PhoneNumber, InvalidNumbersForTheRegionAreRejected) {
  EXPECT_FALSE(formatNumberToE164("0171 234 5678", "US"));
  EXPECT_FALSE(formatNumberToE164("+1 555 123 4567", "US"));
}
