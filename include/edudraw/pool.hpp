#pragma once
#include <cstddef>
#include <optional>
#include <random>
#include <vector>
#include <edudraw/draw_error.hpp>

namespace edudraw {

// Indices into a participant list not yet drawn since the last reset.
using IndexPool = std::vector<std::size_t>;

struct PoolDraw {
  std::size_t index = 0; // selected list position
  IndexPool pool;        // pool the caller should keep
};

// 0..n-1
IndexPool full_pool(std::size_t n);

// Drops indices that no longer fit a list of list_size (order preserved).
IndexPool filter_pool(const IndexPool& pool, std::size_t list_size);

// Draw one index. With no_repeat the candidates come from `pool` and the pick is
// removed from the returned pool; otherwise every position is a candidate and
// the pool is returned unchanged.
// Fails with EmptyList or (no_repeat only) PoolExhausted; on PoolExhausted the
// caller is expected to reset to full_pool(list_size).
std::optional<PoolDraw> draw_from_pool(std::size_t list_size,
                                       const IndexPool& pool,
                                       bool no_repeat,
                                       std::mt19937& rng,
                                       DrawError* why = nullptr);

// True when the item at `index` has been used up in no-repeat mode.
bool is_drawn(const IndexPool& pool, std::size_t index, bool no_repeat);

} // namespace edudraw
