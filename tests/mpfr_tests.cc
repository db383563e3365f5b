// bigexp -- doubles with a 64-bit exponent
// Copyright (C) 2026 The bigexp Authors
// License GPL3+ http://www.gnu.org/licenses/gpl.html

#include <cassert>
#include <cmath>
#include <cstdio>
#include <limits>

#include <mpfr.h>

#include "bigexp_test_support.h"

namespace bigexp_test {
namespace {

using bigexp::xdouble;

const mpfr_prec_t prec = 53;
const std::int64_t wide = std::int64_t(1) << 40;

enum binary_op { op_add, op_sub, op_mul, op_div };

const char *op_name(binary_op op) {
  switch (op) {
    case op_add: return "add";
    case op_sub: return "sub";
    case op_mul: return "mul";
    case op_div: return "div";
  }
  return "?";
}

xdouble apply(binary_op op, const xdouble &a, const xdouble &b) {
  switch (op) {
    case op_add: return a + b;
    case op_sub: return a - b;
    case op_mul: return a * b;
    case op_div: return a / b;
  }
  return xdouble::quiet_nan();
}

void apply(binary_op op, mpfr_t r, const mpfr_t a, const mpfr_t b) {
  switch (op) {
    case op_add: mpfr_add(r, a, b, MPFR_RNDN); break;
    case op_sub: mpfr_sub(r, a, b, MPFR_RNDN); break;
    case op_mul: mpfr_mul(r, a, b, MPFR_RNDN); break;
    case op_div: mpfr_div(r, a, b, MPFR_RNDN); break;
  }
}

void check_binary(binary_op op, const xdouble &a, const xdouble &b, const char *context) {
  mpfr_t ma, mb, mr;
  mpfr_init2(ma, prec);
  mpfr_init2(mb, prec);
  mpfr_init2(mr, prec);
  a.to_mpfr(ma);
  b.to_mpfr(mb);
  apply(op, mr, ma, mb);
  xdouble expected(mr);
  xdouble actual(apply(op, a, b));
  if (actual != expected) {
    std::fprintf(stderr, "mpfr oracle mismatch op=%s context=%s\n  a=%s\n  b=%s\n",
                 op_name(op), context, dump(a).c_str(), dump(b).c_str());
  }
  expect_same(actual, expected, context);
  mpfr_clear(ma);
  mpfr_clear(mb);
  mpfr_clear(mr);
}

void test_round_trip() {
  std::mt19937_64 rng(0x5eed0009);
  mpfr_t m;
  mpfr_init2(m, prec);
  for (int i = 0; i < 5000; ++i) {
    xdouble v(i % 2 ? random_wide(rng, -wide, wide) : xdouble(random_double(rng)));
    v.to_mpfr(m);
    expect_same(xdouble(m), v, "mpfr_round_trip");
  }

  xdouble(-0.0).to_mpfr(m);
  assert(mpfr_zero_p(m) && mpfr_signbit(m));
  expect_same(xdouble(m), xdouble(-0.0), "mpfr_negative_zero");

  xdouble::infinity(false).to_mpfr(m);
  assert(mpfr_inf_p(m) && mpfr_sgn(m) < 0);
  expect_same(xdouble(m), xdouble::infinity(false), "mpfr_negative_infinity");

  xdouble::quiet_nan().to_mpfr(m);
  assert(mpfr_nan_p(m));
  expect_nan(xdouble(m), "mpfr_nan");

  // a non-canonical value below the double range comes back canonical
  xdouble(true, -1050, 0).to_mpfr(m);
  assert(mpfr_cmp_si_2exp(m, 1, -1050) == 0);
  expect_same(xdouble(m), xdouble(std::ldexp(1.0, -1050)), "mpfr_subnormal_band");

  mpfr_set_ui(m, 1, MPFR_RNDN);
  mpfr_mul_2si(m, m, long(wide), MPFR_RNDN);
  expect_fields(xdouble(m), true, wide, 0, "mpfr_huge_power_of_two");
  mpfr_clear(m);
}

void test_rounding_from_mpfr() {
  mpfr_t m;
  mpfr_init2(m, 200);
  mpfr_set_ui(m, 1, MPFR_RNDN);
  mpfr_mul_2si(m, m, -60, MPFR_RNDN);
  mpfr_add_ui(m, m, 1, MPFR_RNDN);
  expect_same(xdouble(m), xdouble(1.0), "mpfr_rounds_to_nearest");

  mpfr_set_ui(m, 3, MPFR_RNDN);
  mpfr_mul_2si(m, m, -54, MPFR_RNDN);
  mpfr_add_ui(m, m, 1, MPFR_RNDN);
  mpfr_neg(m, m, MPFR_RNDN);
  mpfr_mul_2si(m, m, 100000, MPFR_RNDN);
  expect_same(xdouble(m), xdouble(-1.0000000000000002, 100000), "mpfr_rounds_up_wide");
  mpfr_clear(m);
}

void test_binary_oracle() {
  std::mt19937_64 rng(0x5eed000a);
  std::uniform_int_distribution<std::int64_t> delta(-2100, 2100);
  const binary_op ops[] = { op_add, op_sub, op_mul, op_div };
  for (int i = 0; i < 4000; ++i) {
    xdouble a(random_wide(rng, -wide, wide));
    xdouble b(random_wide(rng, -wide, wide));
    std::int64_t d(delta(rng));
    xdouble near(random_wide(rng, a.exponent() + d, a.exponent() + d + 60));
    xdouble same(random_wide(rng, a.exponent(), a.exponent()));
    for (binary_op op : ops) {
      check_binary(op, a, b, "oracle_wide");
      check_binary(op, a, near, "oracle_close_spread");
      check_binary(op, near, a, "oracle_close_spread_swapped");
      check_binary(op, a, same, "oracle_same_exponent");
    }
  }
  check_binary(op_sub, xdouble(1.5, 777), xdouble(1.5, 777), "oracle_exact_cancellation");
}

void test_sqrt_oracle() {
  std::mt19937_64 rng(0x5eed000b);
  mpfr_t m;
  mpfr_init2(m, prec);
  for (int i = 0; i < 5000; ++i) {
    xdouble a(bigexp::abs(random_wide(rng, -wide, wide)));
    a.to_mpfr(m);
    mpfr_sqrt(m, m, MPFR_RNDN);
    expect_same(bigexp::sqrt(a), xdouble(m), "oracle_sqrt");
  }
  mpfr_clear(m);
}

void test_pow_oracle() {
  std::mt19937_64 rng(0x5eed000c);
  std::uniform_real_distribution<double> exponent(-50.0, 50.0);
  std::uniform_int_distribution<int> integer(-40, 40);
  mpfr_t mx, my, mr;
  mpfr_init2(mx, prec);
  mpfr_init2(my, prec);
  mpfr_init2(mr, prec);
  for (int i = 0; i < 3000; ++i) {
    xdouble x(random_wide(rng, -1000000, 1000000));
    double y;
    if (x.sign()) {
      y = exponent(rng);
    } else {
      y = integer(rng);
    }
    x.to_mpfr(mx);
    mpfr_set_d(my, y, MPFR_RNDN);
    mpfr_pow(mr, mx, my, MPFR_RNDN);
    expect_close(bigexp::pow(x, xdouble(y)), xdouble(mr), 1e-14, "oracle_pow");
  }
  mpfr_clear(mx);
  mpfr_clear(my);
  mpfr_clear(mr);
}

} // namespace

void run_mpfr_tests() {
  mpfr_exp_t emin(mpfr_get_emin());
  mpfr_exp_t emax(mpfr_get_emax());
  mpfr_set_emin(mpfr_get_emin_min());
  mpfr_set_emax(mpfr_get_emax_max());
  test_round_trip();
  test_rounding_from_mpfr();
  test_binary_oracle();
  test_sqrt_oracle();
  test_pow_oracle();
  mpfr_set_emin(emin);
  mpfr_set_emax(emax);
}

} // namespace bigexp_test
