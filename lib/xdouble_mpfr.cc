// bigexp -- doubles with a 64-bit exponent
// Copyright (C) 2026 The bigexp Authors
// License GPL3+ http://www.gnu.org/licenses/gpl.html

#include "xdouble.h"

#include "normalize.h"

namespace bigexp {

xdouble::xdouble(const mpfr_t &a) {
  long e(0);
  double x(mpfr_get_d_2exp(&e, a, MPFR_RNDN));
  *this = xdouble(x, std::int64_t(e));
}

void xdouble::to_mpfr(mpfr_t &to) const {
  if (nan) {
    mpfr_set_nan(to);
    return;
  }
  if (! fin) {
    mpfr_set_inf(to, s ? 1 : -1);
    return;
  }
  std::int64_t k(0);
  double x(significand(*this, k));
  mpfr_set_d(to, x, MPFR_RNDN);
  mpfr_mul_2si(to, to, long(k), MPFR_RNDN);
}

} // namespace bigexp
