#ifndef FPCONV_CORE_FORMAT_HPP
#define FPCONV_CORE_FORMAT_HPP

#include "fpconv/core/bits.hpp"

namespace fpconv {

// Format: bit geometry of an IEEE 754-style interchange format.
//
// Describes where the sign, exponent and mantissa live in the storage
// word, and the constants every codec derives from that: the bias,
// the all-ones exponent, and the field masks.
template <int SignBits, int SignOffset, int ExpBits, int ExpOffset,
          int MantBits, int MantOffset, int TotalBits>
struct Format {
  static constexpr int sign_bits = SignBits;
  static constexpr int sign_offset = SignOffset;
  static constexpr int exp_bits = ExpBits;
  static constexpr int exp_offset = ExpOffset;
  static constexpr int mant_bits = MantBits;
  static constexpr int mant_offset = MantOffset;
  static constexpr int total_bits = TotalBits;

  using storage_type = bits_t<TotalBits>;

  // 2^(E-1) - 1
  static constexpr int exponent_bias = (1 << (ExpBits - 1)) - 1;

  // All-ones exponent: reserved for infinities and NaNs.
  static constexpr unsigned max_exponent = (1u << ExpBits) - 1;

  static constexpr storage_type exp_mask =
      (storage_type{1} << ExpBits) - 1;
  static constexpr storage_type mant_mask =
      (storage_type{1} << MantBits) - 1;

  // Compile-time validation
  static_assert(SignBits == 1, "IEEE 754 formats carry one sign bit");
  static_assert(ExpBits >= 2, "exponent field needs room for the reserved "
                              "all-zeros and all-ones encodings");
  static_assert(ExpBits <= 15, "exponent field too wide for an int bias");
  static_assert(MantBits >= 1, "mantissa field must be at least 1 bit");
  static_assert(TotalBits >= SignBits + ExpBits + MantBits,
                "total bits must accommodate all fields");
  static_assert(SignOffset >= 0 && ExpOffset >= 0 && MantOffset >= 0,
                "field offsets must be non-negative");
  static_assert(SignOffset + SignBits <= TotalBits,
                "sign field must fit in storage word");
  static_assert(ExpOffset + ExpBits <= TotalBits,
                "exponent field must fit in storage word");
  static_assert(MantOffset + MantBits <= TotalBits,
                "mantissa field must fit in storage word");
};

// Convenience alias for standard IEEE 754 field ordering: [S][E][M]
template <int ExpBits, int MantBits>
using IEEE_Layout =
    Format<1,                      // SignBits
           ExpBits + MantBits,     // SignOffset (MSB)
           ExpBits,                // ExpBits
           MantBits,               // ExpOffset
           MantBits,               // MantBits
           0,                      // MantOffset (LSB)
           1 + ExpBits + MantBits  // TotalBits
           >;

// Named standard layouts
using fp16_layout = IEEE_Layout<5, 10>;
using fp32_layout = IEEE_Layout<8, 23>;
using fp64_layout = IEEE_Layout<11, 52>;

} // namespace fpconv

#endif // FPCONV_CORE_FORMAT_HPP
