#pragma once
#include <cstddef>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include <edudraw/app_state.hpp>
#include <edudraw/draw_error.hpp>
#include <edudraw/groups.hpp>
#include <edudraw/modes.hpp>
#include <edudraw/pool.hpp>

namespace edudraw {

// Committed result of one draw, fixed before any animation starts.
struct DrawOutcome {
  std::size_t winner_index = 0;
  std::string winner_name;
  std::optional<std::string> paired_task;
  std::optional<std::vector<Group>> groups;

  // "Alice", "Alice is assigned to: Sweep", or the formatted groups.
  std::string result_text() const;
};

struct Predetermination {
  std::optional<DrawOutcome> outcome;
  DrawError error{DrawError::None};
  // Pools the caller should store, whether or not a draw happened
  // (a PoolExhausted result carries the reset pool).
  IndexPool name_pool;
  IndexPool task_pool;
  bool task_pool_reset = false; // task pool ran dry and was refilled
};

// Pick the outcome for `mode` from the lists and pools in `state`.
// - Single/Interactive: one draw on the names (Interactive needs >= 2 names).
// - Paired: a name draw plus an independent task draw; an exhausted task pool
//   is refilled and retried in the same call, an exhausted name pool is not.
// - Groups: partition_groups with state.num_groups; pools untouched.
Predetermination predetermine(DrawMode mode, const AppState& state, std::mt19937& rng);

} // namespace edudraw
