#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <edudraw/history.hpp>
#include <edudraw/modes.hpp>
#include <edudraw/pool.hpp>

namespace edudraw {

// Everything the user can change, in one value. Mutated only by the
// Orchestrator; `version` is bumped on every change.
struct AppState {
  std::uint64_t version = 0;

  std::vector<std::string> names;
  std::vector<std::string> tasks;
  HistoryLog history;

  bool name_no_repeat = false;
  IndexPool name_pool;
  bool task_no_repeat = false;
  IndexPool task_pool;

  DrawMode mode{DrawMode::Single};
  VisualKind visual{VisualKind::Wheel};
  int num_groups = 2;

  const std::vector<std::string>& list(ListKind k) const { return k == ListKind::Names ? names : tasks; }
  std::vector<std::string>& list(ListKind k) { return k == ListKind::Names ? names : tasks; }
  const IndexPool& pool(ListKind k) const { return k == ListKind::Names ? name_pool : task_pool; }
  IndexPool& pool(ListKind k) { return k == ListKind::Names ? name_pool : task_pool; }
  bool no_repeat(ListKind k) const { return k == ListKind::Names ? name_no_repeat : task_no_repeat; }
};

// Six sample names, single mode, wheel, two groups.
AppState default_app_state();

} // namespace edudraw
