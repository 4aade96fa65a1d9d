#ifndef FPCONV_CORE_FIELDS_HPP
#define FPCONV_CORE_FIELDS_HPP

// FieldTriple<Format>: a floating-point value taken apart into its
// sign, biased exponent and stored mantissa.
//
// A plain value type. Classification and the packed storage word are
// derived on demand, never stored, so they cannot disagree with the
// fields.

#include <cstdint>

#include "fpconv/core/checks.hpp"
#include "fpconv/core/classification.hpp"
#include "fpconv/core/format.hpp"

namespace fpconv {

template <typename Fmt> struct FieldTriple {
  using format = Fmt;
  using storage_type = typename Fmt::storage_type;

  unsigned Sign = 0;
  unsigned Exponent = 0;
  storage_type Mantissa = 0;

  constexpr Classification classification() const {
    return classify<Fmt>(Exponent, Mantissa);
  }

  constexpr bool isZero() const {
    return classification() == Classification::Zero;
  }
  constexpr bool isSubnormal() const {
    return classification() == Classification::Subnormal;
  }
  constexpr bool isNormal() const {
    return classification() == Classification::Normal;
  }
  constexpr bool isInfinite() const {
    return classification() == Classification::Infinite;
  }
  constexpr bool isNaN() const {
    return classification() == Classification::NaN;
  }

  constexpr storage_type rawBits() const;

  friend constexpr bool operator==(const FieldTriple &,
                                   const FieldTriple &) = default;
};

using Fields16 = FieldTriple<fp16_layout>;
using Fields32 = FieldTriple<fp32_layout>;
using Fields64 = FieldTriple<fp64_layout>;

// Extract a field of `Width` bits starting at bit `Offset` from `Bits`.
template <typename BitsType>
inline constexpr BitsType extractField(BitsType Bits, int Offset, int Width) {
  if (Width == 0)
    return BitsType{0};
  return (Bits >> Offset) & ((BitsType{1} << Width) - 1);
}

template <typename Fmt>
constexpr typename Fmt::storage_type packFields(const FieldTriple<Fmt> &T) {
  using BitsType = typename Fmt::storage_type;
  return (BitsType(T.Sign & 1u) << Fmt::sign_offset) |
         ((BitsType(T.Exponent) & Fmt::exp_mask) << Fmt::exp_offset) |
         ((T.Mantissa & Fmt::mant_mask) << Fmt::mant_offset);
}

template <typename Fmt>
constexpr FieldTriple<Fmt> unpackFields(typename Fmt::storage_type Bits) {
  FieldTriple<Fmt> T;
  T.Sign = static_cast<unsigned>(
      extractField(Bits, Fmt::sign_offset, Fmt::sign_bits));
  T.Exponent = static_cast<unsigned>(
      extractField(Bits, Fmt::exp_offset, Fmt::exp_bits));
  T.Mantissa = extractField(Bits, Fmt::mant_offset, Fmt::mant_bits);
  return T;
}

template <typename Fmt>
constexpr typename FieldTriple<Fmt>::storage_type
FieldTriple<Fmt>::rawBits() const {
  return packFields(*this);
}

// Build a triple from caller-supplied integers, applying Policy to any
// field that does not fit its width.
template <typename Fmt, FieldCheckPolicy Policy = field_checks::Default>
constexpr FieldTriple<Fmt> makeFields(uint64_t Sign, uint64_t Exponent,
                                      uint64_t Mantissa) {
  using BitsType = typename Fmt::storage_type;
  FieldTriple<Fmt> T;
  T.Sign = static_cast<unsigned>(
      checkField<Policy>(Field::Sign, Sign, Fmt::sign_bits));
  T.Exponent = static_cast<unsigned>(
      checkField<Policy>(Field::Exponent, Exponent, Fmt::exp_bits));
  T.Mantissa =
      BitsType(checkField<Policy>(Field::Mantissa, Mantissa, Fmt::mant_bits));
  return T;
}

} // namespace fpconv

#endif // FPCONV_CORE_FIELDS_HPP
