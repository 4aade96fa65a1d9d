#ifndef FPCONV_CORE_CHECKS_HPP
#define FPCONV_CORE_CHECKS_HPP

// Field-range checking for the decode direction.
//
// Encoding is total: any host value decomposes into in-range fields.
// Decoding takes caller-supplied integers, which may not fit their
// field. A FieldCheckPolicy decides what happens then.

#include <concepts>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "fpconv/core/bits.hpp"

namespace fpconv {

enum class Field { Sign, Exponent, Mantissa };

inline constexpr const char *fieldName(Field F) {
  switch (F) {
  case Field::Sign:     return "sign";
  case Field::Exponent: return "exponent";
  case Field::Mantissa: return "mantissa";
  }
  return "???";
}

// A field value does not fit in the field's declared bit width.
class InvalidFieldRange : public std::out_of_range {
public:
  InvalidFieldRange(Field Which, uint64_t Value, int Width)
      : std::out_of_range(std::string(fieldName(Which)) + " value " +
                          std::to_string(Value) + " does not fit in " +
                          std::to_string(Width) + " bits"),
        Which(Which), Value(Value), Width(Width) {}

  Field field() const noexcept { return Which; }
  uint64_t value() const noexcept { return Value; }
  int width() const noexcept { return Width; }

private:
  Field Which;
  uint64_t Value;
  int Width;
};

template <typename P>
concept FieldCheckPolicy = requires {
  { P::throws_on_range_error } -> std::convertible_to<bool>;
};

namespace field_checks {

// Reject out-of-range fields with InvalidFieldRange.
struct Throw {
  static constexpr bool throws_on_range_error = true;
};

// Keep only the low Width bits of each field. Never throws.
struct Mask {
  static constexpr bool throws_on_range_error = false;
};

using Default = Throw;

static_assert(FieldCheckPolicy<Throw>);
static_assert(FieldCheckPolicy<Mask>);

} // namespace field_checks

// Every value fits a field of 64 or more bits; only 0 fits a field of
// none.
template <FieldCheckPolicy Policy>
constexpr uint64_t checkField(Field Which, uint64_t Value, int Width) {
  const uint64_t Mask = lowBitsMask(Width);
  if ((Value & ~Mask) == 0)
    return Value;
  if constexpr (Policy::throws_on_range_error)
    throw InvalidFieldRange(Which, Value, Width);
  else
    return Value & Mask;
}

} // namespace fpconv

#endif // FPCONV_CORE_CHECKS_HPP
