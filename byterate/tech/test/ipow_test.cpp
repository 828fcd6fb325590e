#include "byterate/ipow.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>

namespace byterate {

TEST(MathHelpers, Power10) {
  EXPECT_EQ(ipow10(0U), 1ULL);
  EXPECT_EQ(ipow10(1U), 10ULL);
  EXPECT_EQ(ipow10(2U), 100ULL);
  EXPECT_EQ(ipow10(9U), 1000000000ULL);
  EXPECT_EQ(ipow10(15U), 1000000000000000ULL);
  EXPECT_EQ(ipow10(19U), 10000000000000000000ULL);
  EXPECT_EQ(ipow10(25U), ipow10(18U));

  static_assert(ipow10(3U) == 1000ULL);
}

TEST(MathHelpers, BinaryPowers) {
  static_assert(ipow(1024, 0) == 1.0);
  static_assert(ipow(1024, 1) == 1024.0);
  EXPECT_EQ(ipow(1024, 3), 1073741824.0);
  EXPECT_EQ(ipow(1024, 8), std::ldexp(1.0, 80));
}

TEST(MathHelpers, DecimalPowers) {
  EXPECT_EQ(ipow(1000, 2), 1e6);
  EXPECT_EQ(ipow(1000, 7), 1e21);
  EXPECT_EQ(ipow(1000, 8), 1e24);
}

}  // namespace byterate
