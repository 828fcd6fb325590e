#pragma once

#include <cstdint>

namespace byterate {

/// How a size in binary units relates to a rate in decimal units when computing a transfer time.
enum class TransferConvention : int8_t {
  // Binary gigabytes count as decimal gigabits: every byte is worth 8 * (1000 / 1024)^3 bits,
  // so that 1 GB moves in 80 s at 100 Mbps.
  kNominal,
  // Raw canonical arithmetic: bits = bytes * 8.
  kExact
};

/// Bits counted per byte under 'convention'.
double TransferBitsPerByte(TransferConvention convention) noexcept;

/// Number of bits needed to transfer 'bytes'. Strictly increasing in 'bytes'.
double SizeToTransferBits(double bytes, TransferConvention convention) noexcept;

/// Seconds needed to transfer 'bytes' at 'bitsPerSecond'.
/// Throws InvalidArgumentError if the rate is not strictly positive.
double TransferSeconds(double bytes, double bitsPerSecond, TransferConvention convention);

/// Bytes transferred at 'bitsPerSecond' during 'seconds', that is bitsPerSecond * seconds / 8.
double TransferredBytes(double bitsPerSecond, double seconds) noexcept;

/// Seconds needed to transfer 'bytes' at a bandwidth given in bytes per second.
/// Throws InvalidArgumentError if the bandwidth is not strictly positive.
double TransferSecondsAtBandwidth(double bytes, double bytesPerSecond);

}  // namespace byterate
