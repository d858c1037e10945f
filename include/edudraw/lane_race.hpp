#pragma once
#include <cstddef>
#include <random>
#include <string>
#include <vector>
#include <edudraw/simulator.hpp>

namespace edudraw {

// Per-participant race state. `progress` is the kinematic position used to
// decide finishing; `display_progress` and `offset` are cosmetic only.
struct Lane {
  std::string name;
  std::size_t index = 0;       // lane == list position
  bool is_winner = false;
  double speed = 0.0;          // track units per second (speed-biased races)
  double duration_ms = 0.0;    // time to finish (duration-biased races)
  double finish_ms = 0.0;      // predicted crossing time from start
  double phase = 0.0;          // wobble phase
  double progress = 0.0;       // [0,1]
  double display_progress = 0.0;
  double offset = 0.0;         // perpendicular wobble, fraction of lane width
};

// True when the winner's crossing time is strictly earlier than every other
// lane's (or it races alone).
bool winner_finishes_first(const std::vector<Lane>& lanes);

// Lane race skeleton: seed lanes, check that the winner cannot be overtaken,
// redraw every frame, conclude once the winner is home and the minimum race
// time has passed, hold the celebration, then Done.
class LaneRaceSimulator : public Simulator {
public:
  const std::vector<Lane>& lanes() const { return lanes_; }
  const Lane* winner_lane() const;
  bool winner_declared() const { return phase() == SimPhase::Concluding || phase() == SimPhase::Done; }

protected:
  LaneRaceSimulator(Scheduler& sched, std::mt19937& rng, double min_race_ms, double celebration_ms)
    : Simulator(sched), rng_(rng), min_race_ms_(min_race_ms), celebration_ms_(celebration_ms) {}

  void on_start_() override;
  void on_cancel_() override { lanes_.clear(); }

  // Fill lanes_ (one per participant) with speed/duration and finish_ms.
  virtual void seed_lanes_() = 0;
  // Update progress, display_progress and offset for the given elapsed time.
  virtual void advance_(double elapsed_ms) = 0;
  // Keep redrawing lanes while the winner is celebrated.
  virtual bool animate_during_hold_() const { return false; }

  std::mt19937& rng_;
  std::vector<Lane> lanes_;

private:
  void frame_();

  double min_race_ms_;
  double celebration_ms_;
};

struct DuckRaceConfig {
  double track_length = 700.0;  // units from start to finish
  double min_speed = 120.0;     // units/s
  double max_speed = 200.0;
  double winner_boost = 1.15;   // over the fastest non-winner
  double surge = 0.15;          // cosmetic speed surge, fraction
  double bob = 0.05;            // cosmetic float, fraction of lane width
  double min_race_ms = 3000.0;
  double celebration_ms = 2000.0;
};

// Speed-biased race: random non-winner speeds, the winner a fixed factor
// faster than the best of them. No duck is drawn ahead of the winner.
class DuckRaceSimulator final : public LaneRaceSimulator {
public:
  DuckRaceSimulator(Scheduler& sched, std::mt19937& rng, DuckRaceConfig cfg = {})
    : LaneRaceSimulator(sched, rng, cfg.min_race_ms, cfg.celebration_ms), cfg_(cfg) {}

  const char* name() const override { return "duck-race"; }
  const DuckRaceConfig& config() const { return cfg_; }

protected:
  void seed_lanes_() override;
  void advance_(double elapsed_ms) override;

private:
  DuckRaceConfig cfg_;
};

struct MarbleRaceConfig {
  double base_duration_ms = 3000.0;  // the winner's time
  double min_extra_ms = 500.0;       // others: base + [min_extra, min_extra + spread)
  double extra_spread_ms = 1500.0;
  double wobble = 0.15;              // lateral, fraction of lane width
  double min_race_ms = 3500.0;
  double celebration_ms = 2000.0;
};

// Duration-biased race: the winner takes the base time, everyone else longer.
// The field keeps rolling in during the celebration hold.
class MarbleRaceSimulator final : public LaneRaceSimulator {
public:
  MarbleRaceSimulator(Scheduler& sched, std::mt19937& rng, MarbleRaceConfig cfg = {})
    : LaneRaceSimulator(sched, rng, cfg.min_race_ms, cfg.celebration_ms), cfg_(cfg) {}

  const char* name() const override { return "marble-race"; }
  const MarbleRaceConfig& config() const { return cfg_; }

protected:
  void seed_lanes_() override;
  void advance_(double elapsed_ms) override;
  bool animate_during_hold_() const override { return true; }

private:
  MarbleRaceConfig cfg_;
};

} // namespace edudraw
