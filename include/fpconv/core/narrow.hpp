#ifndef FPCONV_CORE_NARROW_HPP
#define FPCONV_CORE_NARROW_HPP

// Conversion between IEEE 754 formats of different widths, done
// entirely on field triples.
//
// Narrowing truncates: mantissa bits that do not fit are dropped, never
// rounded, both for normal results and for results that land in the
// destination's subnormal range. An exponent past the destination's
// range becomes infinity, and every NaN becomes the single NaN
// (sign 0, exponent all-ones, mantissa 1).
//
// The truncation has one gap: a result whose leading bit would land
// exactly on the destination's lowest mantissa bit (the binade of the
// smallest destination subnormal) flushes to zero instead of keeping
// mantissa 1. binary32 -> binary16 relies on this, and every other
// pair narrows the same way.
//
// Widening is exact: every value of the narrower format is a value of
// the wider one. NaN payloads are shifted up, not canonicalized.

#include <cstdint>

#include "fpconv/core/checks.hpp"
#include "fpconv/core/classification.hpp"
#include "fpconv/core/codec.hpp"
#include "fpconv/core/fields.hpp"
#include "fpconv/core/format.hpp"

namespace fpconv {

// From narrows to To when To is no wider in any field and every source
// subnormal lies below To's smallest subnormal, 2^(1 - bias - mant_bits).
template <typename To, typename From>
concept NarrowingPair =
    To::exp_bits <= From::exp_bits && To::mant_bits <= From::mant_bits &&
    From::exponent_bias >= To::exponent_bias + To::mant_bits;

// From widens to To when To is no narrower in any field and every source
// subnormal is a normal of To.
template <typename To, typename From>
concept WideningPair =
    To::exp_bits >= From::exp_bits && To::mant_bits >= From::mant_bits &&
    1 - From::exponent_bias - From::mant_bits + To::exponent_bias >= 1;

template <typename To, typename From>
  requires NarrowingPair<To, From>
constexpr FieldTriple<To> narrowFields(const FieldTriple<From> &In) {
  using InBits = typename From::storage_type;
  using OutBits = typename To::storage_type;
  constexpr int Drop = From::mant_bits - To::mant_bits;

  FieldTriple<To> Out;
  Out.Sign = In.Sign;

  switch (In.classification()) {
  case Classification::NaN:
    Out.Sign = 0;
    Out.Exponent = To::max_exponent;
    Out.Mantissa = 1;
    return Out;
  case Classification::Infinite:
    Out.Exponent = To::max_exponent;
    return Out;
  case Classification::Zero:
  case Classification::Subnormal:
    // NarrowingPair puts source subnormals below the destination's
    // smallest subnormal: they flush to a zero of the same sign.
    return Out;
  case Classification::Normal:
    break;
  }

  int Exp = static_cast<int>(In.Exponent) - From::exponent_bias +
            To::exponent_bias;

  if (Exp <= 0) {
    int Shift = 1 - Exp;
    // Includes Shift == mant_bits, the smallest-subnormal binade.
    if (Shift >= To::mant_bits)
      return Out;
    // Restore the implicit bit, then shift it into the subnormal field.
    InBits Full = (InBits{1} << From::mant_bits) | In.Mantissa;
    Out.Mantissa = OutBits((Full >> (Drop + Shift)) & InBits(To::mant_mask));
    return Out;
  }

  if (Exp >= static_cast<int>(To::max_exponent)) {
    Out.Exponent = To::max_exponent;
    return Out;
  }

  Out.Exponent = static_cast<unsigned>(Exp);
  Out.Mantissa = OutBits((In.Mantissa >> Drop) & InBits(To::mant_mask));
  return Out;
}

template <typename To, typename From>
  requires WideningPair<To, From>
constexpr FieldTriple<To> widenFields(const FieldTriple<From> &In) {
  using OutBits = typename To::storage_type;
  constexpr int Grow = To::mant_bits - From::mant_bits;

  FieldTriple<To> Out;
  Out.Sign = In.Sign;

  switch (In.classification()) {
  case Classification::Zero:
    return Out;
  case Classification::Infinite:
    Out.Exponent = To::max_exponent;
    return Out;
  case Classification::NaN:
    Out.Exponent = To::max_exponent;
    Out.Mantissa = OutBits(In.Mantissa) << Grow;
    return Out;
  case Classification::Subnormal: {
    // Find the leading one; it becomes the implicit bit.
    int Top = From::mant_bits - 1;
    while (((In.Mantissa >> Top) & 1) == 0)
      --Top;
    Out.Exponent = static_cast<unsigned>(Top + 1 - From::exponent_bias -
                                         From::mant_bits + To::exponent_bias);
    OutBits Frac = OutBits(In.Mantissa) & ((OutBits{1} << Top) - 1);
    Out.Mantissa = Frac << (To::mant_bits - Top);
    return Out;
  }
  case Classification::Normal:
    break;
  }

  Out.Exponent = static_cast<unsigned>(static_cast<int>(In.Exponent) -
                                       From::exponent_bias + To::exponent_bias);
  Out.Mantissa = OutBits(In.Mantissa) << Grow;
  return Out;
}

// --- binary32 <-> binary16 ---

inline constexpr Fields16 narrow16(const Fields32 &In) {
  return narrowFields<fp16_layout>(In);
}

inline constexpr Fields32 widen32(const Fields16 &In) {
  return widenFields<fp32_layout>(In);
}

// NaN and infinity are recognised from the decomposed fields, so
// their precedence over the finite paths is the switch order above.
inline Fields16 encode16(float Value) { return narrow16(encode32(Value)); }

template <FieldCheckPolicy Policy = field_checks::Default>
float decode16(uint64_t Sign, uint64_t Exponent, uint64_t Mantissa) {
  return decode(widen32(makeFields<fp16_layout, Policy>(Sign, Exponent,
                                                        Mantissa)));
}

} // namespace fpconv

#endif // FPCONV_CORE_NARROW_HPP
