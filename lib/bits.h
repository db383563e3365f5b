// bigexp -- doubles with a 64-bit exponent
// Copyright (C) 2026 The bigexp Authors
// License GPL3+ http://www.gnu.org/licenses/gpl.html

#ifndef BIGEXP_BITS_H
#define BIGEXP_BITS_H 1

#include <cstdint>

namespace bigexp {

// IEEE-754 binary64 layout
const std::uint64_t sign_mask = 0x8000000000000000ULL;
const std::uint64_t exponent_mask = 0x7FF0000000000000ULL;
const std::uint64_t max_mantissa = 0x000FFFFFFFFFFFFFULL;
const int mantissa_bits = 52;

const std::int64_t exponent_bias = 1023;
const std::int64_t max_exponent = 1023;
const std::int64_t min_exponent = -1022;
// biased field 0: zeros and subnormals
const std::int64_t subnormal_exponent = -1023;
// smallest subnormal is 2^-1074
const std::int64_t min_subnormal_exponent = -1074;
// all-ones field, also the sentinel exponent of NaN and infinities
const std::int64_t reserved_exponent = 0x7FF;

struct fields {
  bool sign;                // true when the sign bit is clear
  std::int64_t exponent;
  std::uint64_t mantissa;
  bool nan;
  bool infinite;
};

std::uint64_t to_bits(double x);
double from_bits(std::uint64_t b);

fields decode(double x);

// Places (exponent + 1023) in the 11-bit field without range checks: values
// outside [-1023, 1023] wrap, and 1024 yields an infinity or NaN pattern.
double encode(bool sign, std::int64_t exponent, std::uint64_t mantissa);

// low 52 bits, defined for NaN and infinity as well
std::uint64_t mantissa_of(double x);

// raw field minus the bias: -1023 for zeros and subnormals
std::int64_t exponent_of(double x);

inline bool sign_of(double x) {
  return (to_bits(x) & sign_mask) == 0;
}

} // namespace bigexp

#endif
