#ifndef FPCONV_TESTS_HARNESS_OPS_HPP
#define FPCONV_TESTS_HARNESS_OPS_HPP

// Shared vocabulary for the test harness.
//
// Provides:
//   TestOutput       — result of a conversion (bits + flags)
//   Bits16 / Bits32  — storage words of the two formats
//
// These types belong to no adapter. They are the common language that
// every adapter and the harness itself speaks. Every adapter provides
//   encode(Bits32) -> TestOutput<Bits32>   host value -> packed fields
//   narrow(Bits32) -> TestOutput<Bits16>   binary32 -> binary16
//   widen(Bits16)  -> TestOutput<Bits32>   binary16 -> binary32
// for whichever of the three it can compute.

#include <cstdint>

#include "fpconv/fpconv.hpp"

namespace fpconv::testing {

using Bits16 = fp16_layout::storage_type;
using Bits32 = fp32_layout::storage_type;

// ===================================================================
// TestOutput — result of running a conversion
// ===================================================================

template <typename BitsType> struct TestOutput {
  BitsType Bits;
  uint8_t Flags; // 0 if implementation doesn't report flags
};

} // namespace fpconv::testing

#endif // FPCONV_TESTS_HARNESS_OPS_HPP
