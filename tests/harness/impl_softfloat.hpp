#ifndef FPCONV_TESTS_HARNESS_IMPL_SOFTFLOAT_HPP
#define FPCONV_TESTS_HARNESS_IMPL_SOFTFLOAT_HPP

// SoftFloat adapter: one implementation among equals.
//
// Provides SoftFloatAdapter satisfying the adapter interface:
//   narrow(Bits32) -> TestOutput<Bits16>   f32_to_f16, round_minMag
//   widen(Bits16)  -> TestOutput<Bits32>   f16_to_f32
//
// round_minMag truncates like fpconv, but saturates overflow to the
// largest finite value instead of producing infinity, and keeps the
// smallest subnormal where fpconv flushes. Callers filter those inputs.

#include <cstdint>

#include "harness/ops.hpp"

extern "C" {
#include "softfloat.h"
}

namespace fpconv::testing {

struct SoftFloatAdapter {
  static constexpr const char *name() { return "SoftFloat"; }

  TestOutput<Bits16> narrow(Bits32 In) const {
    softfloat_roundingMode = softfloat_round_minMag;
    float32_t A{static_cast<uint32_t>(In)};
    float16_t R = f32_to_f16(A);
    return {Bits16(R.v), 0};
  }

  TestOutput<Bits32> widen(Bits16 In) const {
    float16_t A{static_cast<uint16_t>(In)};
    float32_t R = f16_to_f32(A);
    return {Bits32(R.v), 0};
  }
};

} // namespace fpconv::testing

#endif // FPCONV_TESTS_HARNESS_IMPL_SOFTFLOAT_HPP
