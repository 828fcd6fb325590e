#include "byterate/unitsparser.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "byterate/errors.hpp"
#include "byterate/unit-table.hpp"

namespace byterate {

namespace {
ParseError::Reason FailureReason(std::string_view str, Dimension dimension) {
  try {
    ParseMagnitude(str, dimension);
  } catch (const ParseError& err) {
    return err.reason();
  }
  ADD_FAILURE() << "'" << str << "' should not be parsable";
  return ParseError::Reason::kInvalidNumber;
}
}  // namespace

TEST(UnitTableTest, Factors) {
  EXPECT_EQ(kSizeUnits[0].factor(), 1.0);
  EXPECT_EQ(kSizeUnits[1].factor(), 1024.0);
  EXPECT_EQ(kSizeUnits[3].factor(), 1073741824.0);
  EXPECT_EQ(kRateBitUnits[2].factor(), 1e6);
  EXPECT_EQ(kRateByteUnits[0].factor(), 8.0);
  EXPECT_EQ(kRateByteUnits[3].factor(), 8e9);
  for (UnitFamily family : {UnitFamily::kSize, UnitFamily::kRateBit, UnitFamily::kRateByte}) {
    const auto units = FamilyUnits(family);
    ASSERT_EQ(units.size(), 9U);
    for (int8_t exponent = 0; exponent < 9; ++exponent) {
      EXPECT_EQ(units[exponent].exponent, exponent);
      EXPECT_EQ(units[exponent].family, family);
    }
  }
}

TEST(UnitTableTest, SizeLookupIgnoresCase) {
  ASSERT_NE(FindSizeUnit("gb"), nullptr);
  EXPECT_EQ(FindSizeUnit("gb")->symbol, "GB");
  EXPECT_EQ(FindSizeUnit("KB")->symbol, "kB");
  EXPECT_EQ(FindSizeUnit("b")->symbol, "B");
  EXPECT_EQ(FindSizeUnit("XB"), nullptr);
  EXPECT_EQ(FindSizeUnit("Mbps"), nullptr);
  EXPECT_EQ(SizeUnit("yB").exponent, 8);
  EXPECT_THROW((void)SizeUnit("GiB"), UnknownUnitError);
}

TEST(UnitTableTest, RateLookupPrefersExactCaseThenBits) {
  EXPECT_EQ(FindRateUnit("Mbps")->family, UnitFamily::kRateBit);
  EXPECT_EQ(FindRateUnit("MBps")->family, UnitFamily::kRateByte);
  EXPECT_EQ(FindRateUnit("Bps")->family, UnitFamily::kRateByte);
  EXPECT_EQ(FindRateUnit("bps")->family, UnitFamily::kRateBit);
  EXPECT_EQ(FindRateUnit("mbps")->symbol, "Mbps");
  EXPECT_EQ(FindRateUnit("MBPS")->symbol, "Mbps");
  EXPECT_EQ(FindRateUnit("kBPS")->symbol, "kbps");
  EXPECT_EQ(FindRateUnit("MB"), nullptr);
  EXPECT_THROW((void)RateUnit("Xbps"), UnknownUnitError);
}

TEST(UnitsParserTest, SizeStrings) {
  EXPECT_EQ(ParseMagnitude("1 B", Dimension::kSize), 1);
  EXPECT_EQ(ParseMagnitude("1.5 kB", Dimension::kSize), 1536);
  EXPECT_EQ(ParseMagnitude("1.5MB", Dimension::kSize), 1572864);
  EXPECT_EQ(ParseMagnitude("  2 gb \t", Dimension::kSize), 2147483648.0);
  EXPECT_EQ(ParseMagnitude("1   TB", Dimension::kSize), 1099511627776.0);
  EXPECT_EQ(ParseMagnitude("-1 kB", Dimension::kSize), -1024);
  EXPECT_EQ(ParseMagnitude("+2 kB", Dimension::kSize), 2048);
  EXPECT_EQ(ParseMagnitude("0 YB", Dimension::kSize), 0);
}

TEST(UnitsParserTest, NumericStringIsCanonical) {
  const ParsedMagnitude parsed = ParseMagnitudeWithUnit("42", Dimension::kSize);
  EXPECT_EQ(parsed.value, 42);
  EXPECT_EQ(parsed.unit, nullptr);
  EXPECT_EQ(ParseMagnitude(" 1000.5 ", Dimension::kRate), 1000.5);
}

TEST(UnitsParserTest, RateStrings) {
  EXPECT_EQ(ParseMagnitude("10 Mbps", Dimension::kRate), 1e7);
  EXPECT_EQ(ParseMagnitude("10Mbps", Dimension::kRate), 1e7);
  EXPECT_EQ(ParseMagnitude("1 MBps", Dimension::kRate), 8e6);
  EXPECT_EQ(ParseMagnitude("1.5 GBps", Dimension::kRate), 1.2e10);
  EXPECT_EQ(ParseMagnitude("100 bps", Dimension::kRate), 100);
  EXPECT_EQ(ParseMagnitude("100 Bps", Dimension::kRate), 800);
  EXPECT_EQ(ParseMagnitude("5 mbps", Dimension::kRate), 5e6);

  const ParsedMagnitude parsed = ParseMagnitudeWithUnit("3 kBps", Dimension::kRate);
  ASSERT_NE(parsed.unit, nullptr);
  EXPECT_EQ(parsed.unit->family, UnitFamily::kRateByte);
}

TEST(UnitsParserTest, InvalidNumber) {
  EXPECT_EQ(FailureReason("", Dimension::kSize), ParseError::Reason::kInvalidNumber);
  EXPECT_EQ(FailureReason("   ", Dimension::kSize), ParseError::Reason::kInvalidNumber);
  EXPECT_EQ(FailureReason("abc", Dimension::kSize), ParseError::Reason::kInvalidNumber);
  EXPECT_EQ(FailureReason("MB", Dimension::kSize), ParseError::Reason::kInvalidNumber);
  EXPECT_EQ(FailureReason("1.2.3 MB", Dimension::kSize), ParseError::Reason::kInvalidNumber);
  EXPECT_EQ(FailureReason("1,5 MB", Dimension::kSize), ParseError::Reason::kInvalidNumber);
  EXPECT_EQ(FailureReason(".5 MB", Dimension::kSize), ParseError::Reason::kInvalidNumber);
  EXPECT_EQ(FailureReason("1. MB", Dimension::kSize), ParseError::Reason::kInvalidNumber);
  EXPECT_EQ(FailureReason("--1 MB", Dimension::kSize), ParseError::Reason::kInvalidNumber);
  EXPECT_EQ(FailureReason("x10 Mbps", Dimension::kRate), ParseError::Reason::kInvalidNumber);
}

TEST(UnitsParserTest, NonFiniteValue) {
  const std::string nines(300, '9');
  EXPECT_EQ(FailureReason(nines + " YB", Dimension::kSize), ParseError::Reason::kInvalidNumber);
  EXPECT_EQ(FailureReason("-" + nines + " YB", Dimension::kSize), ParseError::Reason::kInvalidNumber);
  EXPECT_EQ(FailureReason(nines + " YBps", Dimension::kRate), ParseError::Reason::kInvalidNumber);
  EXPECT_EQ(FailureReason(std::string(400, '9'), Dimension::kSize), ParseError::Reason::kInvalidNumber);
  EXPECT_EQ(ParseMagnitude(nines + " B", Dimension::kSize), ParseMagnitude(nines, Dimension::kSize));
}

TEST(UnitsParserTest, UnrecognizedUnit) {
  EXPECT_EQ(FailureReason("1 XB", Dimension::kSize), ParseError::Reason::kUnrecognizedUnit);
  EXPECT_EQ(FailureReason("1 Mbps", Dimension::kSize), ParseError::Reason::kUnrecognizedUnit);
  EXPECT_EQ(FailureReason("1 MB", Dimension::kRate), ParseError::Reason::kUnrecognizedUnit);
  EXPECT_EQ(FailureReason("1 Mbpss", Dimension::kRate), ParseError::Reason::kUnrecognizedUnit);
  EXPECT_EQ(FailureReason("1 MB5", Dimension::kSize), ParseError::Reason::kUnrecognizedUnit);
  EXPECT_EQ(FailureReason("1 2 MB", Dimension::kSize), ParseError::Reason::kUnrecognizedUnit);
  EXPECT_EQ(FailureReason("1 M B", Dimension::kSize), ParseError::Reason::kUnrecognizedUnit);
}

}  // namespace byterate
