#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <edudraw/app_state.hpp>
#include <edudraw/card.hpp>
#include <edudraw/draw_error.hpp>
#include <edudraw/history.hpp>
#include <edudraw/lane_race.hpp>
#include <edudraw/outcome.hpp>
#include <edudraw/scheduler.hpp>
#include <edudraw/simulator.hpp>
#include <edudraw/wheel.hpp>

namespace edudraw {

// Timing and look of the four visualizations.
struct SimTuning {
  WheelConfig wheel{};
  DuckRaceConfig duck{};
  MarbleRaceConfig marble{};
  CardConfig card{};
};

// Single writer of AppState. Runs draws one at a time: synchronous modes are
// finalized inside request_draw(); interactive draws start one simulator
// session and are finalized from its completion callback.
class Orchestrator {
public:
  using NoticeSink = std::function<void(const std::string&)>;
  using EntrySink  = std::function<void(const HistoryEntry&)>;
  using StateSink  = std::function<void(const AppState&)>;

  explicit Orchestrator(Scheduler& sched,
                        AppState initial = default_app_state(),
                        unsigned int seed = std::random_device{}(),
                        SimTuning tuning = {});
  ~Orchestrator();
  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

  const AppState& state() const { return state_; }

  // --- Draws
  DrawError request_draw();
  bool session_active() const;
  // Tear down the running animation without finalizing it.
  void cancel_session();

  const std::string& result_text() const { return result_text_; }
  const std::optional<Winner>& current_winner() const { return current_winner_; }

  // Simulators, for rendering.
  const WheelSimulator& wheel() const { return wheel_; }
  const DuckRaceSimulator& duck_race() const { return duck_; }
  const MarbleRaceSimulator& marble_race() const { return marble_; }
  const CardRevealSimulator& card() const { return card_; }
  const Simulator& simulator_for(VisualKind v) const;

  // --- List management
  // Names split on newlines/tabs, tasks are taken whole. Returns how many
  // new unique items were added.
  std::size_t add_items(ListKind list, const std::string& text);
  bool remove_item(ListKind list, std::size_t index);
  void clear_list(ListKind list);
  void shuffle_names();
  void set_no_repeat(ListKind list, bool on);

  // --- Settings
  void set_mode(DrawMode mode);
  // Rejected (false) while an animation runs.
  bool set_visual(VisualKind visual);
  void set_num_groups(int n);
  // Clears history and refills both pools.
  void reset_all();

  std::string history_text() const { return format_history(state_.history); }

  // --- Hooks
  void set_notice_sink(NoticeSink sink) { notice_ = std::move(sink); }
  void set_cue_sink(CueSink sink);
  void set_on_outcome_finalized(EntrySink sink) { on_finalized_ = std::move(sink); }
  void set_on_state_changed(StateSink sink) { on_changed_ = std::move(sink); }

private:
  Simulator& simulator_for_(VisualKind v);
  void finalize_(const std::string& result, std::optional<std::vector<Group>> groups);
  void handle_interactive_end_();
  void notice_msg_(const std::string& msg) const;
  void changed_();
  void teardown_();

  Scheduler& sched_;
  AppState state_;
  std::mt19937 rng_;

  WheelSimulator wheel_;
  DuckRaceSimulator duck_;
  MarbleRaceSimulator marble_;
  CardRevealSimulator card_;

  std::optional<Winner> current_winner_;
  std::string result_text_{"Click 'DRAW LOTS' to begin!"};

  NoticeSink notice_;
  CueSink cue_;
  EntrySink on_finalized_;
  StateSink on_changed_;
};

} // namespace edudraw
