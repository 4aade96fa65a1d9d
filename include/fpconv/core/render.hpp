#ifndef FPCONV_CORE_RENDER_HPP
#define FPCONV_CORE_RENDER_HPP

// Text renderings of a field triple's storage word, and the symbolic
// names callers use in place of non-finite numbers.

#include <cmath>
#include <string>

#include "fpconv/core/fields.hpp"

namespace fpconv {

// Packed bits, most significant first: one character per storage bit.
template <typename Fmt> std::string toBinaryString(const FieldTriple<Fmt> &T) {
  using BitsType = typename Fmt::storage_type;
  BitsType Bits = T.rawBits();
  std::string Out;
  Out.reserve(Fmt::total_bits);
  for (int I = Fmt::total_bits - 1; I >= 0; --I)
    Out.push_back(((Bits >> I) & BitsType{1}) != 0 ? '1' : '0');
  return Out;
}

// "0x" followed by one uppercase digit per nibble of storage.
template <typename Fmt> std::string toHexString(const FieldTriple<Fmt> &T) {
  using BitsType = typename Fmt::storage_type;
  constexpr int Width = (Fmt::total_bits + 3) / 4;
  BitsType Bits = T.rawBits();
  std::string Out = "0x";
  Out.reserve(2 + Width);
  for (int I = Width - 1; I >= 0; --I) {
    int Nibble = static_cast<int>((Bits >> (I * 4)) & BitsType{0xF});
    Out.push_back("0123456789ABCDEF"[Nibble]);
  }
  return Out;
}

// "Infinity", "-Infinity" or "NaN"; nullptr for finite values, which
// are exchanged as ordinary numbers.
template <typename F> const char *specialValueName(F Value) {
  if (std::isnan(Value))
    return "NaN";
  if (std::isinf(Value))
    return std::signbit(Value) ? "-Infinity" : "Infinity";
  return nullptr;
}

} // namespace fpconv

#endif // FPCONV_CORE_RENDER_HPP
