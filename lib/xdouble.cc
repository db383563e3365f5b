// bigexp -- doubles with a 64-bit exponent
// Copyright (C) 2026 The bigexp Authors
// License GPL3+ http://www.gnu.org/licenses/gpl.html

#include "xdouble.h"

#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

#include "normalize.h"

namespace bigexp {

const xdouble xdouble::min_value(false, std::numeric_limits<std::int64_t>::min(), max_mantissa);
const xdouble xdouble::max_value(true, std::numeric_limits<std::int64_t>::max(), max_mantissa);

xdouble::xdouble(const double &x) {
  fields d(decode(x));
  s = d.sign;
  e = d.exponent;
  m = d.mantissa;
  nan = d.nan;
  fin = ! (d.nan || d.infinite);
}

xdouble::xdouble(const double &x0, const std::int64_t &e0) {
  if (x0 == 0 || std::isnan(x0) || std::isinf(x0)) {
    *this = xdouble(x0);
    return;
  }
  std::int64_t e1(std::ilogb(x0));
  if (e0 > 0 && e1 > std::numeric_limits<std::int64_t>::max() - e0) {
    *this = infinity(sign_of(x0));
    return;
  }
  if (e0 < 0 && e1 < std::numeric_limits<std::int64_t>::min() - e0) {
    *this = infinity(false);
    return;
  }
  double x1(std::ldexp(x0, -int(e1)));
  e1 += e0;
  if (min_subnormal_exponent <= e1 && e1 <= max_exponent) {
    // a native double holds it, store that double's fields
    *this = xdouble(std::ldexp(x1, int(e1)));
  } else {
    s = sign_of(x1);
    e = e1;
    m = mantissa_of(x1);
    nan = false;
    fin = true;
  }
}

xdouble xdouble::finite_only(const double &x) {
  if (std::isnan(x)) {
    throw std::domain_error("bigexp::xdouble: cannot construct a finite value from NaN");
  }
  if (std::isinf(x)) {
    throw std::domain_error("bigexp::xdouble: cannot construct a finite value from an infinity");
  }
  return xdouble(x);
}

xdouble xdouble::infinity(bool sign) {
  return xdouble(sign, reserved_exponent, 0, false, false);
}

xdouble xdouble::quiet_nan() {
  return xdouble(std::numeric_limits<double>::quiet_NaN());
}

double xdouble::to_double() const {
  if (nan) {
    return encode(s, max_exponent + 1, m);
  }
  if (! fin) {
    return s ? std::numeric_limits<double>::infinity() : -std::numeric_limits<double>::infinity();
  }
  if (e == subnormal_exponent) {
    return encode(s, e, m);
  }
  if (e > reserved_exponent) {
    return s ? std::numeric_limits<double>::infinity() : -std::numeric_limits<double>::infinity();
  }
  if (e <= -reserved_exponent) {
    return -std::numeric_limits<double>::infinity();
  }
  if (e > max_exponent) {
    // the biased field would collide with the infinity pattern
    return encode(s, max_exponent, max_mantissa);
  }
  if (e >= min_exponent) {
    return encode(s, e, m);
  }
  // rounds into the subnormals, anything below 2^-1076 is a signed zero
  int k(e < min_subnormal_exponent - 2 ? int(min_subnormal_exponent - 2) : int(e));
  return std::ldexp(encode(s, 0, m), k);
}

bool operator==(const xdouble &a, const xdouble &b) {
  return a.s == b.s && a.nan == b.nan && a.fin == b.fin && a.e == b.e && a.m == b.m;
}

bool operator!=(const xdouble &a, const xdouble &b) {
  return ! (a == b);
}

int compare(const xdouble &a, const xdouble &b) {
  if (a.nan) {
    return b.nan ? 0 : -1;
  }
  if (b.nan) {
    return 1;
  }
  if (! a.fin && ! b.fin) {
    return a.s == b.s ? 0 : a.s ? 1 : -1;
  }
  if (! a.fin) {
    return a.s ? 1 : -1;
  }
  if (! b.fin) {
    return b.s ? -1 : 1;
  }
  bool za(a.is_zero());
  bool zb(b.is_zero());
  if (za && zb) {
    return a.s == b.s ? 0 : a.s ? 1 : -1;
  }
  if (za) {
    return b.s ? -1 : 1;
  }
  if (zb) {
    return a.s ? 1 : -1;
  }
  if (a.s != b.s) {
    return a.s ? 1 : -1;
  }
  int c(0);
  if (a.e != b.e) {
    c = a.e < b.e ? -1 : 1;
  } else if (a.m != b.m) {
    c = a.m < b.m ? -1 : 1;
  }
  return a.s ? c : -c;
}

xdouble min(const xdouble &a, const xdouble &b) {
  if (a.is_nan()) {
    return a;
  }
  if (b.is_nan()) {
    return b;
  }
  return compare(a, b) <= 0 ? a : b;
}

xdouble max(const xdouble &a, const xdouble &b) {
  if (a.is_nan()) {
    return a;
  }
  if (b.is_nan()) {
    return b;
  }
  return compare(a, b) >= 0 ? a : b;
}

xdouble abs(const xdouble &a) {
  if (a.nan) {
    return a;
  }
  xdouble r(a);
  r.s = true;
  return r;
}

xdouble operator-(const xdouble &a) {
  if (a.nan) {
    return a;
  }
  xdouble r(a);
  r.s = ! a.s;
  return r;
}

std::ostream& operator<<(std::ostream& o, const xdouble& a) {
  std::int64_t e(0);
  double x(significand(a, e));
  std::streamsize p(o.precision(17));
  o << x << " " << e;
  o.precision(p);
  return o;
}

std::istream& operator>>(std::istream& i, xdouble& a) {
  double x(0);
  std::int64_t e(0);
  if (i >> x >> e) {
    a = xdouble(x, e);
  }
  return i;
}

} // namespace bigexp
