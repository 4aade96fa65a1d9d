#ifndef FPCONV_CORE_CODEC_HPP
#define FPCONV_CORE_CODEC_HPP

// Field codec for formats the host FPU stores natively.
//
// encode reinterprets the host value's storage and splits it into
// fields; decode packs fields and reinterprets them back. Neither
// touches the value arithmetically, so decode(encode(v)) returns v's
// exact bit pattern, -0 and NaN payloads included.

#include <cstdint>

#include "fpconv/core/bits.hpp"
#include "fpconv/core/checks.hpp"
#include "fpconv/core/fields.hpp"
#include "fpconv/core/format.hpp"

namespace fpconv {

// Host type that stores a given layout. Undefined for layouts the
// host has no type for (binary16).
template <typename Fmt> struct HostFloat;

template <> struct HostFloat<fp32_layout> {
  using type = float;
};

template <> struct HostFloat<fp64_layout> {
  using type = double;
};

template <typename Fmt>
FieldTriple<Fmt> encode(typename HostFloat<Fmt>::type Value) {
  return unpackFields<Fmt>(bitsOf<Fmt::total_bits>(Value));
}

template <typename Fmt>
typename HostFloat<Fmt>::type decode(const FieldTriple<Fmt> &T) {
  using Host = typename HostFloat<Fmt>::type;
  return valueOf<Host, Fmt::total_bits>(packFields(T));
}

// --- binary32 ---

inline Fields32 encode32(float Value) { return encode<fp32_layout>(Value); }

template <FieldCheckPolicy Policy = field_checks::Default>
float decode32(uint64_t Sign, uint64_t Exponent, uint64_t Mantissa) {
  return decode(makeFields<fp32_layout, Policy>(Sign, Exponent, Mantissa));
}

} // namespace fpconv

#endif // FPCONV_CORE_CODEC_HPP
