#include <edudraw/orchestrator.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <edudraw/random.hpp>

namespace edudraw {

namespace {

constexpr const char* kAnimatingText = "...ANIMATING...";

std::string trim(const std::string& s) {
  auto not_space = [](unsigned char c) { return !std::isspace(c); };
  auto b = std::find_if(s.begin(), s.end(), not_space);
  auto e = std::find_if(s.rbegin(), s.rend(), not_space).base();
  return b < e ? std::string(b, e) : std::string{};
}

// Names arrive pasted one per line (or tab separated); tasks are single items.
std::vector<std::string> split_items(ListKind list, const std::string& text) {
  std::vector<std::string> out;
  if (list == ListKind::Tasks) {
    auto t = trim(text);
    if (!t.empty()) out.push_back(std::move(t));
    return out;
  }
  std::string cur;
  for (char c : text) {
    if (c == '\n' || c == '\t' || c == '\r') {
      auto t = trim(cur);
      if (!t.empty()) out.push_back(std::move(t));
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  auto t = trim(cur);
  if (!t.empty()) out.push_back(std::move(t));
  return out;
}

} // namespace

Orchestrator::Orchestrator(Scheduler& sched, AppState initial, unsigned int seed, SimTuning tuning)
  : sched_(sched),
    state_(std::move(initial)),
    rng_(seed),
    wheel_(sched, tuning.wheel),
    duck_(sched, rng_, tuning.duck),
    marble_(sched, rng_, tuning.marble),
    card_(sched, rng_, tuning.card) {
  state_.num_groups = std::max(1, state_.num_groups);
  if (state_.history.size() > kMaxHistory) state_.history.resize(kMaxHistory);
}

Orchestrator::~Orchestrator() {
  teardown_();
}

Simulator& Orchestrator::simulator_for_(VisualKind v) {
  switch (v) {
    case VisualKind::DuckRace:   return duck_;
    case VisualKind::MarbleRace: return marble_;
    case VisualKind::Card:       return card_;
    case VisualKind::Wheel:
    default:                     return wheel_;
  }
}

const Simulator& Orchestrator::simulator_for(VisualKind v) const {
  switch (v) {
    case VisualKind::DuckRace:   return duck_;
    case VisualKind::MarbleRace: return marble_;
    case VisualKind::Card:       return card_;
    case VisualKind::Wheel:
    default:                     return wheel_;
  }
}

bool Orchestrator::session_active() const {
  return wheel_.active() || duck_.active() || marble_.active() || card_.active();
}

void Orchestrator::set_cue_sink(CueSink sink) {
  cue_ = sink;
  wheel_.set_cue_sink(sink);
  duck_.set_cue_sink(sink);
  marble_.set_cue_sink(sink);
  card_.set_cue_sink(sink);
}

DrawError Orchestrator::request_draw() {
  if (session_active()) {
    spdlog::info("draw rejected: animation still running");
    notice_msg_(user_message(DrawError::SessionAlreadyActive));
    return DrawError::SessionAlreadyActive;
  }

  const DrawMode mode = state_.mode;
  Predetermination pre = predetermine(mode, state_, rng_);

  if (!pre.outcome) {
    // An exhausted pool comes back already reset; keep it.
    if (pre.name_pool != state_.name_pool || pre.task_pool != state_.task_pool) {
      state_.name_pool = std::move(pre.name_pool);
      state_.task_pool = std::move(pre.task_pool);
      changed_();
    }
    if (pre.error == DrawError::InsufficientItems) {
      notice_msg_("Need at least " + std::to_string(state_.num_groups) + " names.");
    } else {
      notice_msg_(user_message(pre.error));
    }
    spdlog::info("{} draw not performed: {}", to_string(mode), to_string(pre.error));
    return pre.error;
  }

  DrawOutcome& o = *pre.outcome;

  if (mode == DrawMode::Interactive) {
    Winner w{o.winner_index, o.winner_name};
    Simulator& sim = simulator_for_(state_.visual);
    bool started = false;
    try {
      started = sim.start(state_.names, w, [this] { handle_interactive_end_(); });
    } catch (const std::logic_error& e) {
      spdlog::error("{} failed to start: {}", sim.name(), e.what());
    }
    if (!started) {
      notice_msg_(user_message(DrawError::AnimationFailed));
      return DrawError::AnimationFailed;
    }
    state_.name_pool = std::move(pre.name_pool);
    current_winner_ = std::move(w);
    result_text_ = kAnimatingText;
    spdlog::info("interactive draw started on {}", display_name(state_.visual));
    changed_();
    return DrawError::None;
  }

  state_.name_pool = std::move(pre.name_pool);
  state_.task_pool = std::move(pre.task_pool);
  if (pre.task_pool_reset) notice_msg_("All tasks assigned! Resetting task list.");

  if (mode == DrawMode::Groups) {
    result_text_ = "Groups Created! (" + std::to_string(o.groups->size()) + " groups)";
  } else {
    result_text_ = o.result_text();
  }
  if (cue_) cue_(AudioCue::DrawCommit);
  finalize_(o.result_text(), std::move(o.groups));
  return DrawError::None;
}

void Orchestrator::handle_interactive_end_() {
  if (!current_winner_) return;
  result_text_ = current_winner_->name;
  finalize_(current_winner_->name, std::nullopt);
}

void Orchestrator::finalize_(const std::string& result, std::optional<std::vector<Group>> groups) {
  HistoryEntry entry = make_history_entry(result, state_.mode, state_.history, std::move(groups));
  state_.history = append_history(state_.history, entry);
  spdlog::info("finalized ({}): {}", to_string(entry.mode), entry.result);
  changed_();
  if (on_finalized_) on_finalized_(entry);
}

void Orchestrator::cancel_session() {
  teardown_();
}

void Orchestrator::teardown_() {
  if (!session_active()) return;
  wheel_.cancel();
  duck_.cancel();
  marble_.cancel();
  card_.cancel();
  current_winner_.reset();
  if (result_text_ == kAnimatingText) result_text_ = "Draw cancelled.";
  spdlog::info("animation cancelled");
}

std::size_t Orchestrator::add_items(ListKind list, const std::string& text) {
  auto items = split_items(list, text);
  if (items.empty()) return 0;

  auto& current = state_.list(list);
  std::vector<std::string> fresh;
  for (auto& it : items) {
    const bool seen = std::find(current.begin(), current.end(), it) != current.end() ||
                      std::find(fresh.begin(), fresh.end(), it) != fresh.end();
    if (!seen) fresh.push_back(std::move(it));
  }

  if (fresh.empty()) {
    notice_msg_("Items already exist in the list.");
    return 0;
  }

  teardown_();
  const std::size_t added = fresh.size();
  for (auto& f : fresh) current.push_back(std::move(f));
  state_.pool(list) = full_pool(current.size());
  notice_msg_(std::to_string(added) + " item(s) added.");
  changed_();
  return added;
}

bool Orchestrator::remove_item(ListKind list, std::size_t index) {
  auto& current = state_.list(list);
  if (index >= current.size()) return false;
  teardown_();
  current.erase(current.begin() + static_cast<std::ptrdiff_t>(index));
  state_.pool(list) = full_pool(current.size());
  changed_();
  return true;
}

void Orchestrator::clear_list(ListKind list) {
  teardown_();
  state_.list(list).clear();
  state_.pool(list).clear();
  if (list == ListKind::Names) state_.history.clear();
  changed_();
}

void Orchestrator::shuffle_names() {
  teardown_();
  fisher_yates(state_.names, rng_);
  state_.name_pool = full_pool(state_.names.size());
  state_.history.clear();
  notice_msg_("Names shuffled & history cleared.");
  changed_();
}

void Orchestrator::set_no_repeat(ListKind list, bool on) {
  if (list == ListKind::Names) state_.name_no_repeat = on;
  else state_.task_no_repeat = on;
  if (on) state_.pool(list) = full_pool(state_.list(list).size());
  changed_();
}

void Orchestrator::set_mode(DrawMode mode) {
  if (mode == state_.mode) return;
  teardown_();
  state_.mode = mode;
  changed_();
}

bool Orchestrator::set_visual(VisualKind visual) {
  if (session_active()) return false;
  if (visual != state_.visual) {
    state_.visual = visual;
    changed_();
  }
  return true;
}

void Orchestrator::set_num_groups(int n) {
  const int clamped = std::max(1, n);
  if (clamped == state_.num_groups) return;
  state_.num_groups = clamped;
  changed_();
}

void Orchestrator::reset_all() {
  teardown_();
  state_.history.clear();
  state_.name_pool = full_pool(state_.names.size());
  state_.task_pool = full_pool(state_.tasks.size());
  notice_msg_("All pools and history reset.");
  changed_();
}

void Orchestrator::notice_msg_(const std::string& msg) const {
  if (msg.empty()) return;
  if (notice_) notice_(msg);
}

void Orchestrator::changed_() {
  ++state_.version;
  if (on_changed_) on_changed_(state_);
}

} // namespace edudraw
