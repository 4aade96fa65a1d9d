#ifndef FPCONV_CORE_CLASSIFICATION_HPP
#define FPCONV_CORE_CLASSIFICATION_HPP

#include <cstdint>

#include "fpconv/core/bits.hpp"

namespace fpconv {

enum class Classification {
  Zero,      // all-zeros exponent, zero mantissa
  Subnormal, // all-zeros exponent, non-zero mantissa
  Normal,    // any other exponent
  Infinite,  // all-ones exponent, zero mantissa
  NaN        // all-ones exponent, non-zero mantissa
};

inline constexpr const char *classificationName(Classification C) {
  switch (C) {
  case Classification::Zero:      return "zero";
  case Classification::Subnormal: return "subnormal";
  case Classification::Normal:    return "normal";
  case Classification::Infinite:  return "infinite";
  case Classification::NaN:       return "nan";
  }
  return "???";
}

// Label an (exponent, mantissa) pair of a format whose exponent field
// is ExpWidth bits wide. Exactly one label applies to every in-range
// pair. Defined for any ExpWidth: the all-ones exponent saturates at
// 64 bits, and a zero-width field has only the all-zeros exponent.
inline constexpr Classification classify(uint64_t Exponent, uint64_t Mantissa,
                                         int ExpWidth) {
  const uint64_t MaxExponent = lowBitsMask(ExpWidth);
  if (Exponent == 0)
    return Mantissa == 0 ? Classification::Zero : Classification::Subnormal;
  if (Exponent == MaxExponent)
    return Mantissa == 0 ? Classification::Infinite : Classification::NaN;
  return Classification::Normal;
}

template <typename Fmt>
constexpr Classification classify(uint64_t Exponent, uint64_t Mantissa) {
  return classify(Exponent, Mantissa, Fmt::exp_bits);
}

} // namespace fpconv

#endif // FPCONV_CORE_CLASSIFICATION_HPP
