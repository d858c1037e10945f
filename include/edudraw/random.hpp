#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <random>
#include <utility>
#include <vector>

namespace edudraw {

// Uniform sample in [0, 1). Deterministic with caller-provided rng.
inline double uniform01(std::mt19937& rng) {
  std::uniform_real_distribution<double> U(0.0, 1.0);
  return U(rng);
}

// floor(u * n) for u in [0,1); n must be > 0.
inline std::size_t pick_position(std::size_t n, std::mt19937& rng) {
  const auto pos = static_cast<std::size_t>(std::floor(uniform01(rng) * static_cast<double>(n)));
  return std::min(pos, n - 1); // guard rounding at u -> 1
}

// Unbiased Fisher-Yates: every permutation equally likely.
template <class T>
void fisher_yates(std::vector<T>& v, std::mt19937& rng) {
  if (v.size() < 2) return;
  for (std::size_t i = v.size() - 1; i > 0; --i) {
    const std::size_t j = pick_position(i + 1, rng);
    std::swap(v[i], v[j]);
  }
}

} // namespace edudraw
