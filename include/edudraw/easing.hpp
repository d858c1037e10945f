#pragma once
#include <cmath>

namespace edudraw {

inline double clamp01(double x) {
  return x < 0.0 ? 0.0 : (x > 1.0 ? 1.0 : x);
}

// Quadratic ease-in-out.
inline double ease_in_out_quad(double p) {
  p = clamp01(p);
  return p < 0.5 ? 2.0 * p * p : 1.0 - std::pow(-2.0 * p + 2.0, 2.0) / 2.0;
}

// CSS-style cubic-bezier(x1, y1, x2, y2) timing curve through (0,0) and (1,1).
struct CubicBezier {
  double x1 = 0.25, y1 = 0.1, x2 = 0.25, y2 = 1.0;

  double operator()(double p) const {
    p = clamp01(p);
    if (p == 0.0 || p == 1.0) return p;
    const double t = solve_t_(p);
    return sample_(y1, y2, t);
  }

private:
  static double sample_(double a1, double a2, double t) {
    // B(t) = 3(1-t)^2 t a1 + 3(1-t) t^2 a2 + t^3
    const double u = 1.0 - t;
    return 3.0 * u * u * t * a1 + 3.0 * u * t * t * a2 + t * t * t;
  }
  static double slope_(double a1, double a2, double t) {
    const double u = 1.0 - t;
    return 3.0 * u * u * a1 + 6.0 * u * t * (a2 - a1) + 3.0 * t * t * (1.0 - a2);
  }
  // x(t) is monotonic for x1,x2 in [0,1]: Newton first, bisection fallback.
  double solve_t_(double x) const {
    double t = x;
    for (int i = 0; i < 8; ++i) {
      const double err = sample_(x1, x2, t) - x;
      if (std::fabs(err) < 1e-7) return t;
      const double d = slope_(x1, x2, t);
      if (std::fabs(d) < 1e-6) break;
      t = clamp01(t - err / d);
    }
    double lo = 0.0, hi = 1.0;
    t = x;
    for (int i = 0; i < 60; ++i) {
      const double v = sample_(x1, x2, t);
      if (std::fabs(v - x) < 1e-7) break;
      if (v < x) lo = t; else hi = t;
      t = 0.5 * (lo + hi);
    }
    return t;
  }
};

} // namespace edudraw
