// bigexp -- doubles with a 64-bit exponent
// Copyright (C) 2026 The bigexp Authors
// License GPL3+ http://www.gnu.org/licenses/gpl.html

#ifndef BIGEXP_XDOUBLE_H
#define BIGEXP_XDOUBLE_H 1

#include <cstdint>
#include <iosfwd>

#include <mpfr.h>

#include "bits.h"

namespace bigexp {

// A double's sign and 52-bit mantissa with a signed 64-bit exponent.
//
// For exponent -1023 the mantissa is a raw subnormal field, so that every
// native double (zeros and subnormals included) converts exactly; any other
// exponent e means (1 + mantissa / 2^52) * 2^e.
class xdouble {
private:
  bool s;
  std::int64_t e;
  std::uint64_t m;
  bool nan;
  bool fin;
  constexpr xdouble(bool s0, std::int64_t e0, std::uint64_t m0, bool nan0, bool fin0)
    : s(s0), e(e0), m(m0), nan(nan0), fin(fin0) { };
public:
  // (false, INT64_MIN, max_mantissa)
  static const xdouble min_value;
  // (true, INT64_MAX, max_mantissa)
  static const xdouble max_value;

  constexpr xdouble() : s(true), e(subnormal_exponent), m(0), nan(false), fin(true) { };
  xdouble(const double &x);
  // x * 2^e0; past INT64_MAX saturates to the signed infinity, past
  // INT64_MIN to negative infinity
  xdouble(const double &x0, const std::int64_t &e0);
  // fields stored verbatim, mantissa must be within [0, max_mantissa]
  constexpr xdouble(bool sign, std::int64_t exponent, std::uint64_t mantissa)
    : s(sign), e(exponent), m(mantissa), nan(false), fin(true) { };
  explicit xdouble(const mpfr_t &a);

  // throws std::domain_error for NaN and infinities
  static xdouble finite_only(const double &x);
  static xdouble infinity(bool sign);
  static xdouble quiet_nan();

  bool sign() const { return s; };
  std::int64_t exponent() const { return e; };
  std::uint64_t mantissa() const { return m; };
  bool is_nan() const { return nan; };
  bool is_finite() const { return fin && ! nan; };
  bool is_infinite() const { return ! fin && ! nan; };
  bool is_zero() const { return fin && ! nan && e == subnormal_exponent && m == 0; };

  // exponents from 1024 to 0x7FF clamp to the largest finite double,
  // exponents at or below -0x7FF give negative infinity
  double to_double() const;
  void to_mpfr(mpfr_t &to) const;

  friend bool operator==(const xdouble &a, const xdouble &b);
  friend bool operator!=(const xdouble &a, const xdouble &b);
  friend int compare(const xdouble &a, const xdouble &b);
  friend xdouble abs(const xdouble &a);
  friend xdouble operator-(const xdouble &a);
  friend xdouble operator+(const xdouble &a, const xdouble &b);
  friend xdouble operator-(const xdouble &a, const xdouble &b);
  friend xdouble operator*(const xdouble &a, const xdouble &b);
  friend xdouble operator/(const xdouble &a, const xdouble &b);
  friend xdouble recip(const xdouble &a);
  friend xdouble sqrt(const xdouble &a);
  friend xdouble pow(const xdouble &a, const xdouble &b);
  friend xdouble ldexp(const xdouble &a, std::int64_t e);
  friend std::ostream& operator<<(std::ostream& o, const xdouble& a);
  friend std::istream& operator>>(std::istream& i, xdouble& a);

  xdouble &operator+=(const xdouble &a) {
    *this = *this + a;
    return *this;
  };
  xdouble &operator-=(const xdouble &a) {
    *this = *this - a;
    return *this;
  };
  xdouble &operator*=(const xdouble &a) {
    *this = *this * a;
    return *this;
  };
  xdouble &operator/=(const xdouble &a) {
    *this = *this / a;
    return *this;
  };
};

bool operator==(const xdouble &a, const xdouble &b);
bool operator!=(const xdouble &a, const xdouble &b);

// -1, 0 or 1; a total order in which NaN is the least value and -0 < +0
int compare(const xdouble &a, const xdouble &b);

inline bool operator<(const xdouble &a, const xdouble &b) {
  return compare(a, b) < 0;
}

inline bool operator<=(const xdouble &a, const xdouble &b) {
  return compare(a, b) <= 0;
}

inline bool operator>(const xdouble &a, const xdouble &b) {
  return compare(a, b) > 0;
}

inline bool operator>=(const xdouble &a, const xdouble &b) {
  return compare(a, b) >= 0;
}

xdouble min(const xdouble &a, const xdouble &b);
xdouble max(const xdouble &a, const xdouble &b);

xdouble abs(const xdouble &a);
xdouble operator-(const xdouble &a);
xdouble operator+(const xdouble &a, const xdouble &b);
xdouble operator-(const xdouble &a, const xdouble &b);
xdouble operator*(const xdouble &a, const xdouble &b);
xdouble operator/(const xdouble &a, const xdouble &b);
xdouble recip(const xdouble &a);
xdouble sqrt(const xdouble &a);
xdouble pow(const xdouble &a, const xdouble &b);
xdouble ldexp(const xdouble &a, std::int64_t e);

inline bool isnan(const xdouble &a) {
  return a.is_nan();
}

inline bool isinf(const xdouble &a) {
  return a.is_infinite();
}

inline bool isfinite(const xdouble &a) {
  return a.is_finite();
}

inline bool iszero(const xdouble &a) {
  return a.is_zero();
}

inline bool signbit(const xdouble &a) {
  return ! a.sign();
}

inline std::int64_t exponent(double x) {
  return exponent_of(x);
}

inline std::int64_t exponent(const xdouble &x) {
  return x.exponent();
}

std::ostream& operator<<(std::ostream& o, const xdouble& a);
std::istream& operator>>(std::istream& i, xdouble& a);

} // namespace bigexp

#endif
