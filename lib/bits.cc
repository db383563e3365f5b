// bigexp -- doubles with a 64-bit exponent
// Copyright (C) 2026 The bigexp Authors
// License GPL3+ http://www.gnu.org/licenses/gpl.html

#include "bits.h"

#include <cstring>

namespace bigexp {

std::uint64_t to_bits(double x) {
  std::uint64_t b;
  std::memcpy(&b, &x, sizeof(b));
  return b;
}

double from_bits(std::uint64_t b) {
  double x;
  std::memcpy(&x, &b, sizeof(x));
  return x;
}

std::uint64_t mantissa_of(double x) {
  return to_bits(x) & max_mantissa;
}

std::int64_t exponent_of(double x) {
  return std::int64_t((to_bits(x) & exponent_mask) >> mantissa_bits) - exponent_bias;
}

fields decode(double x) {
  std::uint64_t b(to_bits(x));
  fields f;
  f.sign = (b & sign_mask) == 0;
  f.mantissa = b & max_mantissa;
  f.nan = false;
  f.infinite = false;
  if ((b & exponent_mask) == exponent_mask) {
    f.exponent = reserved_exponent;
    if (f.mantissa != 0) {
      f.nan = true;
    } else {
      f.infinite = true;
    }
  } else {
    f.exponent = exponent_of(x);
  }
  return f;
}

double encode(bool sign, std::int64_t exponent, std::uint64_t mantissa) {
  std::uint64_t b(0);
  if (! sign) {
    b |= sign_mask;
  }
  b |= ((std::uint64_t(exponent) + std::uint64_t(exponent_bias)) << mantissa_bits) & exponent_mask;
  b |= mantissa & max_mantissa;
  return from_bits(b);
}

} // namespace bigexp
