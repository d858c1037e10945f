#include <edudraw/outcome.hpp>
#include <spdlog/spdlog.h>

namespace edudraw {

std::string DrawOutcome::result_text() const {
  if (groups) return format_groups(*groups);
  if (paired_task) return winner_name + " is assigned to: " + *paired_task;
  return winner_name;
}

static Predetermination fail_(Predetermination p, DrawError e) {
  p.error = e;
  p.outcome.reset();
  return p;
}

Predetermination predetermine(DrawMode mode, const AppState& state, std::mt19937& rng) {
  Predetermination out;
  out.name_pool = state.name_pool;
  out.task_pool = state.task_pool;

  if (state.names.empty()) return fail_(std::move(out), DrawError::EmptyList);

  if (mode == DrawMode::Groups) {
    DrawError why{DrawError::None};
    auto groups = partition_groups(state.names, state.num_groups, rng, &why);
    if (!groups) return fail_(std::move(out), why);
    DrawOutcome o;
    o.groups = std::move(*groups);
    out.outcome = std::move(o);
    return out;
  }

  if (mode == DrawMode::Interactive && state.names.size() < 2) {
    return fail_(std::move(out), DrawError::NotEnoughNames);
  }
  // Checked before the name draw so a rejected paired draw consumes nothing.
  if (mode == DrawMode::Paired && state.tasks.empty()) {
    return fail_(std::move(out), DrawError::NoTasksAvailable);
  }

  DrawError why{DrawError::None};
  auto name = draw_from_pool(state.names.size(), state.name_pool, state.name_no_repeat, rng, &why);
  if (!name) {
    if (why == DrawError::PoolExhausted) {
      spdlog::info("name pool exhausted; resetting {} names", state.names.size());
      out.name_pool = full_pool(state.names.size());
    }
    return fail_(std::move(out), why);
  }

  DrawOutcome o;
  o.winner_index = name->index;
  o.winner_name = state.names[name->index];
  out.name_pool = std::move(name->pool);

  if (mode == DrawMode::Paired) {
    auto task = draw_from_pool(state.tasks.size(), state.task_pool, state.task_no_repeat, rng, &why);
    if (!task && why == DrawError::PoolExhausted) {
      spdlog::info("task pool exhausted; resetting {} tasks and retrying", state.tasks.size());
      out.task_pool_reset = true;
      task = draw_from_pool(state.tasks.size(), full_pool(state.tasks.size()),
                            state.task_no_repeat, rng, &why);
    }
    if (!task) {
      out.name_pool = state.name_pool;
      return fail_(std::move(out), why);
    }
    o.paired_task = state.tasks[task->index];
    out.task_pool = std::move(task->pool);
  }

  spdlog::debug("predetermined {} draw: #{} {}", to_string(mode), o.winner_index, o.winner_name);
  out.outcome = std::move(o);
  return out;
}

} // namespace edudraw
