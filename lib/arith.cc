// bigexp -- doubles with a 64-bit exponent
// Copyright (C) 2026 The bigexp Authors
// License GPL3+ http://www.gnu.org/licenses/gpl.html

#include "xdouble.h"

#include <cmath>
#include <limits>

#include "normalize.h"

namespace bigexp {

namespace {

enum overflow { in_range, above, below };

overflow add_exponents(std::int64_t a, std::int64_t b, std::int64_t &r) {
  if (b > 0 && a > std::numeric_limits<std::int64_t>::max() - b) {
    return above;
  }
  if (b < 0 && a < std::numeric_limits<std::int64_t>::min() - b) {
    return below;
  }
  r = a + b;
  return in_range;
}

overflow sub_exponents(std::int64_t a, std::int64_t b, std::int64_t &r) {
  if (b < 0 && a > std::numeric_limits<std::int64_t>::max() + b) {
    return above;
  }
  if (b > 0 && a < std::numeric_limits<std::int64_t>::min() + b) {
    return below;
  }
  r = a - b;
  return in_range;
}

xdouble signed_zero(bool sign) {
  return xdouble(sign ? 0.0 : -0.0);
}

// x * 2^e where e came from a checked exponent sum; past INT64_MAX is the
// signed infinity, past INT64_MIN is negative infinity whatever the sign
xdouble saturate(overflow o, bool sign, double x, std::int64_t e) {
  switch (o) {
    case above:
      return xdouble::infinity(sign);
    case below:
      return xdouble::infinity(false);
    case in_range:
      break;
  }
  return xdouble(x, e);
}

} // namespace

xdouble operator+(const xdouble &a, const xdouble &b) {
  if (a.nan) {
    return a;
  }
  if (b.nan) {
    return b;
  }
  if (! a.fin && ! b.fin) {
    return a.s == b.s ? a : xdouble::quiet_nan();
  }
  if (a.is_zero()) {
    return b.is_zero() ? xdouble(a.to_double() + b.to_double()) : b;
  }
  if (b.is_zero()) {
    return a;
  }
  std::pair<normalized, normalized> n(normalize(a, b));
  if (n.first.out_of_bounds) {
    return b;
  }
  if (n.second.out_of_bounds) {
    return a;
  }
  // both sides carry the same shift, so the native result's own exponent
  // change (carry or cancellation) survives when the shift is added back
  return xdouble(n.first.scaled + n.second.scaled, n.first.exponent_adjustment);
}

xdouble operator-(const xdouble &a, const xdouble &b) {
  return a + -b;
}

xdouble operator*(const xdouble &a, const xdouble &b) {
  if (a.nan) {
    return a;
  }
  if (b.nan) {
    return b;
  }
  bool s(a.s == b.s);
  if (! a.fin || ! b.fin) {
    if (a.is_zero() || b.is_zero()) {
      return xdouble::quiet_nan();
    }
    return xdouble::infinity(s);
  }
  if (a.is_zero() || b.is_zero()) {
    return signed_zero(s);
  }
  std::int64_t ea(0);
  std::int64_t eb(0);
  double xa(significand(a, ea));
  double xb(significand(b, eb));
  std::int64_t e(0);
  overflow o(add_exponents(ea, eb, e));
  return saturate(o, s, xa * xb, e);
}

xdouble operator/(const xdouble &a, const xdouble &b) {
  if (a.nan) {
    return a;
  }
  if (b.nan) {
    return b;
  }
  bool s(a.s == b.s);
  if (! a.fin) {
    return b.fin ? xdouble::infinity(s) : xdouble::quiet_nan();
  }
  if (! b.fin) {
    return signed_zero(s);
  }
  if (b.is_zero()) {
    return a.is_zero() ? xdouble::quiet_nan() : xdouble::infinity(s);
  }
  if (a.is_zero()) {
    return signed_zero(s);
  }
  std::int64_t ea(0);
  std::int64_t eb(0);
  double xa(significand(a, ea));
  double xb(significand(b, eb));
  std::int64_t e(0);
  overflow o(sub_exponents(ea, eb, e));
  return saturate(o, s, xa / xb, e);
}

xdouble recip(const xdouble &a) {
  return xdouble(1.0) / a;
}

xdouble sqrt(const xdouble &a) {
  if (a.nan || a.is_zero()) {
    return a;
  }
  if (! a.s) {
    return xdouble::quiet_nan();
  }
  if (! a.fin) {
    return a;
  }
  std::int64_t e(0);
  double x(significand(a, e));
  if (e & 1) {
    x *= 2;
    e -= 1;
  }
  return xdouble(std::sqrt(x), e / 2);
}

xdouble ldexp(const xdouble &a, std::int64_t e) {
  if (! a.is_finite() || a.is_zero()) {
    return a;
  }
  std::int64_t ea(0);
  double x(significand(a, ea));
  std::int64_t r(0);
  overflow o(add_exponents(ea, e, r));
  return saturate(o, a.s, x, r);
}

xdouble pow(const xdouble &a, const xdouble &b) {
  const xdouble one(1.0);
  if (b.is_zero() || a == one) {
    return one;
  }
  if (a.nan || b.nan) {
    return xdouble::quiet_nan();
  }
  // tiny exponents are 0 and huge ones infinite, not the to_double() clamps
  double y(scaled(b, 0));
  if (a.is_zero() || ! a.fin) {
    return xdouble(std::pow(a.to_double(), y));
  }
  if (std::isinf(y)) {
    int c(compare(abs(a), one));
    if (c == 0) {
      return one;
    }
    return (c > 0) == (y > 0) ? xdouble::infinity(true) : xdouble(0.0);
  }
  bool negative(false);
  if (! a.s) {
    if (y != std::floor(y)) {
      return xdouble::quiet_nan();
    }
    negative = std::fmod(y, 2.0) != 0;
  }
  // |a|^y = 2^(y * ea) * |xa|^y, keeping the integer part of y * ea apart
  // so its fraction is not lost to a large exponent; r is the exact
  // rounding error of p
  std::int64_t ea(0);
  double xa(significand(a, ea));
  long double p((long double) y * (long double) ea);
  long double r(std::fma((long double) y, (long double) ea, -p));
  long double n(std::floor(p));
  long double f((p - n) + r + (long double) y * std::log2((long double) std::fabs(xa)));
  long double n2(std::floor(f));
  f -= n2;
  n += n2;
  const long double limit(std::ldexp(1.0L, 63));
  if (n >= limit) {
    return xdouble::infinity(! negative);
  }
  if (n < -limit) {
    return xdouble::infinity(false);
  }
  double x((double) std::exp2(f));
  return xdouble(negative ? -x : x, std::int64_t(n));
}

} // namespace bigexp
