// bigexp -- doubles with a 64-bit exponent
// Copyright (C) 2026 The bigexp Authors
// License GPL3+ http://www.gnu.org/licenses/gpl.html

#ifndef BIGEXP_NORMALIZE_H
#define BIGEXP_NORMALIZE_H 1

#include <cstdint>
#include <utility>

#include "xdouble.h"

namespace bigexp {

// widest exponent spread two values can have and still share one double
const std::uint64_t max_spread = 0x7FF;

struct normalized {
  const xdouble *source;
  // source * 2^-exponent_adjustment as a native double
  double scaled;
  // negligible next to its counterpart
  bool out_of_bounds;
  // add back to the exponent of a native result computed from scaled
  std::int64_t exponent_adjustment;
};

// Shifts a pair of values by a common exponent so that their scaled doubles
// can be combined with native arithmetic. When the exponents are more than
// max_spread apart, or one value is not finite, the smaller side is flagged
// out_of_bounds and the larger side is shifted to exponent 0 on its own.
std::pair<normalized, normalized> normalize(const xdouble &a, const xdouble &b);

// v * 2^-shift as a native double, rounding into the subnormal range or to
// zero as needed
double scaled(const xdouble &v, std::int64_t shift);

// Returns x with |x| in [1, 2) and sets e so that v = x * 2^e. Zeros give a
// signed 0 with e = 0, NaN and infinities give to_double() with e = 0.
double significand(const xdouble &v, std::int64_t &e);

} // namespace bigexp

#endif
