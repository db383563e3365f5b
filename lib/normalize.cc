// bigexp -- doubles with a 64-bit exponent
// Copyright (C) 2026 The bigexp Authors
// License GPL3+ http://www.gnu.org/licenses/gpl.html

#include "normalize.h"

#include <cmath>
#include <limits>

// ldexp is slower than assembling the bits when the target is a normal double
//#define BIGEXP_USE_LDEXP

namespace bigexp {

namespace {

// e - shift, clamped to a range where ldexp saturates anyway
int target_exponent(std::int64_t e, std::int64_t shift) {
  const std::int64_t limit = 2 * reserved_exponent;
  if (shift >= 0 && e < std::numeric_limits<std::int64_t>::min() + shift) {
    return -int(limit);
  }
  if (shift < 0 && e > std::numeric_limits<std::int64_t>::max() + shift) {
    return int(limit);
  }
  std::int64_t t(e - shift);
  if (t < -limit) {
    return -int(limit);
  }
  if (t > limit) {
    return int(limit);
  }
  return int(t);
}

} // namespace

double significand(const xdouble &v, std::int64_t &e) {
  e = 0;
  if (! v.is_finite() || v.is_zero()) {
    return v.to_double();
  }
  if (v.exponent() == subnormal_exponent) {
    double x(encode(v.sign(), subnormal_exponent, v.mantissa()));
    int k(std::ilogb(x));
    e = k;
    return std::ldexp(x, -k);
  }
  e = v.exponent();
  return encode(v.sign(), 0, v.mantissa());
}

double scaled(const xdouble &v, std::int64_t shift) {
  if (! v.is_finite() || v.is_zero()) {
    return v.to_double();
  }
  std::int64_t e(0);
  double x(significand(v, e));
  int k(target_exponent(e, shift));
#ifdef BIGEXP_USE_LDEXP
  return std::ldexp(x, k);
#else
  if (min_exponent <= k && k <= max_exponent) {
    return encode(v.sign(), k, mantissa_of(x));
  }
  return std::ldexp(x, k);
#endif
}

std::pair<normalized, normalized> normalize(const xdouble &a, const xdouble &b) {
  normalized na = { &a, a.to_double(), true, 0 };
  normalized nb = { &b, b.to_double(), true, 0 };
  bool fa(a.is_finite());
  bool fb(b.is_finite());
  if (! fa && ! fb) {
    return std::make_pair(na, nb);
  }
  bool a_larger(a.exponent() >= b.exponent());
  std::uint64_t spread(a_larger
    ? std::uint64_t(a.exponent()) - std::uint64_t(b.exponent())
    : std::uint64_t(b.exponent()) - std::uint64_t(a.exponent()));
  if (! fa || ! fb || spread > max_spread) {
    // the smaller side cannot change the larger at double precision
    normalized &big((fa && fb) ? (a_larger ? na : nb) : (fa ? nb : na));
    big.out_of_bounds = false;
    if (big.source->is_finite()) {
      big.exponent_adjustment = big.source->exponent();
      big.scaled = scaled(*big.source, big.exponent_adjustment);
    }
    return std::make_pair(na, nb);
  }
  // center the pair on exponent 0; an odd spread of 0x7FF rounds up so the
  // larger side stays at 1023 and clear of the reserved field
  std::int64_t half(spread == max_spread ? std::int64_t((max_spread + 1) / 2) : std::int64_t(spread / 2));
  std::int64_t adjustment((a_larger ? b.exponent() : a.exponent()) + half);
  na.out_of_bounds = false;
  nb.out_of_bounds = false;
  na.exponent_adjustment = adjustment;
  nb.exponent_adjustment = adjustment;
  na.scaled = scaled(a, adjustment);
  nb.scaled = scaled(b, adjustment);
  return std::make_pair(na, nb);
}

} // namespace bigexp
