#include <edudraw/pool.hpp>
#include <algorithm>
#include <numeric>
#include <edudraw/random.hpp>

namespace edudraw {

static inline void set_error(DrawError* why, DrawError e) {
  if (why) *why = e;
}

IndexPool full_pool(std::size_t n) {
  IndexPool p(n);
  std::iota(p.begin(), p.end(), std::size_t{0});
  return p;
}

IndexPool filter_pool(const IndexPool& pool, std::size_t list_size) {
  IndexPool out;
  out.reserve(pool.size());
  for (std::size_t i : pool) {
    if (i < list_size) out.push_back(i);
  }
  return out;
}

std::optional<PoolDraw> draw_from_pool(std::size_t list_size,
                                       const IndexPool& pool,
                                       bool no_repeat,
                                       std::mt19937& rng,
                                       DrawError* why) {
  if (list_size == 0) {
    set_error(why, DrawError::EmptyList);
    return std::nullopt;
  }

  IndexPool candidates = no_repeat ? filter_pool(pool, list_size) : full_pool(list_size);
  if (candidates.empty()) {
    set_error(why, DrawError::PoolExhausted);
    return std::nullopt;
  }

  const std::size_t pos = pick_position(candidates.size(), rng);
  PoolDraw out;
  out.index = candidates[pos];
  if (no_repeat) {
    // Remove by position; indices are positions in the list.
    candidates.erase(candidates.begin() + static_cast<std::ptrdiff_t>(pos));
    out.pool = std::move(candidates);
  } else {
    out.pool = pool;
  }
  set_error(why, DrawError::None);
  return out;
}

bool is_drawn(const IndexPool& pool, std::size_t index, bool no_repeat) {
  if (!no_repeat) return false;
  return std::find(pool.begin(), pool.end(), index) == pool.end();
}

} // namespace edudraw
