#ifndef FPCONV_CORE_BITS_HPP
#define FPCONV_CORE_BITS_HPP

// bits_t<N>: a fixed-width bit container parameterized on width.
//
// Not an integer semantically — a bag of bits. Supports shift, mask,
// OR, AND, comparison. The underlying type is _BitInt(N) on Clang,
// with a fallback to standard types / __int128 on GCC.
//
// bitsOf / valueOf move a host float's storage in and out of a
// bits_t without going through arithmetic, so signed zeros and NaN
// payloads are carried bit for bit.

#include <cstdint>
#include <cstring>

namespace fpconv {

#if defined(__clang__)

template <int N>
using bits_t = unsigned _BitInt(N);

#elif defined(__SIZEOF_INT128__)

// GCC C++ mode: no _BitInt. Map to the smallest standard unsigned
// type that fits N bits. Limited to N <= 128.
namespace detail {

template <int N>
struct BitsStorage {
  static_assert(N > 0 && N <= 128,
                "GCC fallback limited to 128 bits; use Clang for wider types");
};

template <int N>
  requires(N > 0 && N <= 8)
struct BitsStorage<N> {
  using type = uint8_t;
};

template <int N>
  requires(N > 8 && N <= 16)
struct BitsStorage<N> {
  using type = uint16_t;
};

template <int N>
  requires(N > 16 && N <= 32)
struct BitsStorage<N> {
  using type = uint32_t;
};

template <int N>
  requires(N > 32 && N <= 64)
struct BitsStorage<N> {
  using type = uint64_t;
};

template <int N>
  requires(N > 64 && N <= 128)
struct BitsStorage<N> {
  using type = unsigned __int128;
};

} // namespace detail

template <int N>
using bits_t = typename detail::BitsStorage<N>::type;

#else
#error "Requires Clang (_BitInt) or GCC (__int128)"
#endif

// The low Width bits set. Widths past 64 saturate, non-positive widths
// give an empty mask.
inline constexpr uint64_t lowBitsMask(int Width) {
  if (Width <= 0)
    return 0;
  if (Width >= 64)
    return ~uint64_t{0};
  return (uint64_t{1} << Width) - 1;
}

// Host floating-point types and the machine word that holds them.
template <typename F> struct HostWord;

template <> struct HostWord<float> {
  using type = uint32_t;
};

template <> struct HostWord<double> {
  using type = uint64_t;
};

template <int N, typename F> bits_t<N> bitsOf(F Value) {
  static_assert(sizeof(F) * 8 == N, "storage width must match host type");
  typename HostWord<F>::type U;
  std::memcpy(&U, &Value, sizeof(F));
  return bits_t<N>(U);
}

template <typename F, int N> F valueOf(bits_t<N> Bits) {
  static_assert(sizeof(F) * 8 == N, "storage width must match host type");
  auto U = static_cast<typename HostWord<F>::type>(Bits);
  F Value;
  std::memcpy(&Value, &U, sizeof(F));
  return Value;
}

} // namespace fpconv

#endif // FPCONV_CORE_BITS_HPP
