#pragma once

#include <cstdint>

namespace byterate {

/// Optimization of ipow(10, uint8_t exp)
/// Returns uint64_t power of 10 for exponents 0-19, or 10^18 for larger exponents.
constexpr uint64_t ipow10(uint32_t exp) noexcept {
  constexpr uint64_t kPow10Table[] = {1ULL,
                                      10ULL,
                                      100ULL,
                                      1000ULL,
                                      10000ULL,
                                      100000ULL,
                                      1000000ULL,
                                      10000000ULL,
                                      100000000ULL,
                                      1000000000ULL,
                                      10000000000ULL,
                                      100000000000ULL,
                                      1000000000000ULL,
                                      10000000000000ULL,
                                      100000000000000ULL,
                                      1000000000000000ULL,
                                      10000000000000000ULL,
                                      100000000000000000ULL,
                                      1000000000000000000ULL,
                                      10000000000000000000ULL};
  return exp < sizeof(kPow10Table) / sizeof(kPow10Table[0]) ? kPow10Table[exp] : kPow10Table[18];
}

/// Floating point power with integral exponent. Powers of 1024 are exact (1024^8 = 2^80 does not fit in 64 bits),
/// powers of 1000 are exact up to 1000^7 and correctly rounded for 1000^8.
constexpr double ipow(double base, uint32_t exp) noexcept {
  double ret = 1.0;
  for (; exp != 0; --exp) {
    ret *= base;
  }
  return ret;
}

}  // namespace byterate
