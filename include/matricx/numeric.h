#pragma once

#include <cmath>

namespace matricx {

// Coerces NaN/Inf readings to a fallback before they reach width arithmetic.
inline double finiteOr(double v, double fallback = 0.0) {
  return std::isfinite(v) ? v : fallback;
}

}  // namespace matricx
