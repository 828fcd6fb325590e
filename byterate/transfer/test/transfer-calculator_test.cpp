#include "byterate/transfer-calculator.hpp"

#include <gtest/gtest.h>

#include "byterate/builtin-languages.hpp"
#include "byterate/errors.hpp"
#include "byterate/language-registry.hpp"
#include "byterate/rate.hpp"
#include "byterate/size.hpp"

namespace byterate {

class TransferCalculatorTest : public ::testing::Test {
 protected:
  void SetUp() override { LoadBuiltinLanguages(registry); }

  LanguageRegistry registry;
  TransferCalculator calculator;
  TransferCalculator exactCalculator{TransferConvention::kExact};
};

TEST_F(TransferCalculatorTest, DefaultConventionIsNominal) {
  EXPECT_EQ(calculator.convention(), TransferConvention::kNominal);
  EXPECT_EQ(exactCalculator.convention(), TransferConvention::kExact);
}

TEST_F(TransferCalculatorTest, TransferTime) {
  EXPECT_EQ(calculator.transferTime("1 GB", "100 Mbps"), 80);
  EXPECT_EQ(calculator.transferTime(Size::gb(4), Rate::mbps(100)), 320);
  EXPECT_EQ(calculator.transferTime(Size::gb(1), "12.5 MBps"), 80);
  EXPECT_DOUBLE_EQ(exactCalculator.transferTime("1 GB", "100 Mbps"), 85.89934592);
  EXPECT_THROW((void)calculator.transferTime("1 GB", 0), InvalidArgumentError);
  EXPECT_THROW((void)calculator.transferTime("1 GB", "-1 Mbps"), InvalidArgumentError);
  EXPECT_THROW((void)calculator.transferTime("1 GiB", "1 Mbps"), ParseError);
}

TEST_F(TransferCalculatorTest, TransferTimeGrowsWithSize) {
  EXPECT_EQ(calculator.transferTime("2 GB", "25 Mbps"), 640);
  EXPECT_LT(calculator.transferTime(Size::mb(1023), Rate::mbps(100)),
            calculator.transferTime(Size::mb(1024), Rate::mbps(100)));
  EXPECT_LT(calculator.transferTime(Size::kb(1023), Rate::mbps(100)),
            calculator.transferTime(Size::mb(1), Rate::mbps(100)));
  EXPECT_LT(calculator.transferTime(Size::gb(1023.5), Rate::mbps(100)),
            calculator.transferTime(Size::tb(1), Rate::mbps(100)));
}

TEST_F(TransferCalculatorTest, TransferAmount) {
  EXPECT_EQ(calculator.transferAmount("100 Mbps", 60).value(), 750000000);
  EXPECT_EQ(calculator.estimateFileSize(Rate::mbps(5), 3600).value(), 2250000000);
  EXPECT_EQ(calculator.transferAmount("10 Mbps", 7200).humanize(), "8.38 GB");
  // amounts do not depend on the convention
  EXPECT_EQ(exactCalculator.transferAmount("100 Mbps", 60), calculator.transferAmount("100 Mbps", 60));
  EXPECT_EQ(exactCalculator.estimateFileSize("100 Mbps", 60), Size(750000000));
}

TEST_F(TransferCalculatorTest, Bandwidth) {
  EXPECT_DOUBLE_EQ(TransferCalculator::transferTimeAtBandwidth("2 GB", "10 MB"), 204.8);
  EXPECT_EQ(TransferCalculator::transferAmountAtBandwidth("10 MB", 60), Size::mb(600));
  EXPECT_THROW((void)TransferCalculator::transferTimeAtBandwidth("2 GB", 0), InvalidArgumentError);
}

TEST_F(TransferCalculatorTest, FormattedTransferTime) {
  EXPECT_EQ(calculator.formattedTransferTime("1 GB", "100 Mbps", registry), "1 minute, 20 seconds");
  EXPECT_EQ(calculator.formattedTransferTime("1 GB", "100 Mbps", registry, "ru"), "1 минута и 20 секунд");
  EXPECT_EQ(calculator.formattedTransferTime("100 GB", "10 Mbps", registry), "22 hours, 13 minutes");
  EXPECT_EQ(calculator.formattedTransferTime("1 MB", "1 Gbps", registry), "less than a second");
}

}  // namespace byterate
