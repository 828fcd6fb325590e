#include "byterate/transfer-math.hpp"

#include "byterate/errors.hpp"
#include "byterate/ipow.hpp"

namespace byterate {

namespace {

constexpr double kBitsPerByte = 8;

// 8 * 10^9 / 2^30, exactly representable.
constexpr double kNominalBitsPerByte = kBitsPerByte * ipow(1000, 3) / ipow(1024, 3);

static_assert(kNominalBitsPerByte * ipow(1024, 3) == 8e9);

}  // namespace

double TransferBitsPerByte(TransferConvention convention) noexcept {
  return convention == TransferConvention::kExact ? kBitsPerByte : kNominalBitsPerByte;
}

double SizeToTransferBits(double bytes, TransferConvention convention) noexcept {
  return bytes * TransferBitsPerByte(convention);
}

double TransferSeconds(double bytes, double bitsPerSecond, TransferConvention convention) {
  if (!(bitsPerSecond > 0)) {
    throw InvalidArgumentError("Transfer rate should be strictly positive, got {} bps", bitsPerSecond);
  }
  return SizeToTransferBits(bytes, convention) / bitsPerSecond;
}

double TransferredBytes(double bitsPerSecond, double seconds) noexcept {
  return bitsPerSecond * seconds / kBitsPerByte;
}

double TransferSecondsAtBandwidth(double bytes, double bytesPerSecond) {
  if (!(bytesPerSecond > 0)) {
    throw InvalidArgumentError("Bandwidth should be strictly positive, got {} B/s", bytesPerSecond);
  }
  return bytes / bytesPerSecond;
}

}  // namespace byterate
