#include <edudraw/lane_race.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <edudraw/easing.hpp>
#include <edudraw/random.hpp>

namespace edudraw {

bool winner_finishes_first(const std::vector<Lane>& lanes) {
  const Lane* w = nullptr;
  for (const auto& l : lanes) {
    if (l.is_winner) {
      if (w) return false; // exactly one winner
      w = &l;
    }
  }
  if (!w) return false;
  for (const auto& l : lanes) {
    if (&l == w) continue;
    if (!(w->finish_ms < l.finish_ms)) return false;
  }
  return true;
}

const Lane* LaneRaceSimulator::winner_lane() const {
  for (const auto& l : lanes_) if (l.is_winner) return &l;
  return nullptr;
}

void LaneRaceSimulator::on_start_() {
  lanes_.clear();
  seed_lanes_();
  if (!winner_finishes_first(lanes_)) {
    lanes_.clear();
    throw std::logic_error(std::string(name()) + ": seeded lanes let the winner be overtaken");
  }
  advance_(0.0);
  schedule_frame_([this] { frame_(); });
}

void LaneRaceSimulator::frame_() {
  const double elapsed = elapsed_ms();
  advance_(elapsed);

  const Lane* w = winner_lane();
  if (phase() == SimPhase::Running && w && w->progress >= 1.0 && elapsed >= min_race_ms_) {
    spdlog::debug("{}: '{}' home at {:.0f} ms", name(), w->name, elapsed);
    conclude_();
    cue_(AudioCue::RaceFinish);
    schedule_after_(celebration_ms_, [this] { finish_(); });
    if (!animate_during_hold_()) return;
  }
  schedule_frame_([this] { frame_(); });
}

// ---- Duck race ----

void DuckRaceSimulator::seed_lanes_() {
  const auto& names = participants();
  const std::size_t w = winner().index;
  const double lo = cfg_.min_speed;
  const double hi = std::max(cfg_.max_speed, cfg_.min_speed);

  double fastest_other = lo;
  lanes_.reserve(names.size());
  for (std::size_t i = 0; i < names.size(); ++i) {
    Lane l;
    l.name = names[i];
    l.index = i;
    l.is_winner = (i == w);
    l.speed = lo + uniform01(rng_) * (hi - lo);
    l.phase = static_cast<double>(i) * 0.7 + uniform01(rng_);
    if (!l.is_winner) fastest_other = std::max(fastest_other, l.speed);
    lanes_.push_back(std::move(l));
  }
  lanes_[w].speed = fastest_other * cfg_.winner_boost;

  for (auto& l : lanes_) {
    l.finish_ms = l.speed > 0.0 ? cfg_.track_length / l.speed * 1000.0
                                : std::numeric_limits<double>::infinity();
  }
}

void DuckRaceSimulator::advance_(double elapsed_ms) {
  const double t = elapsed_ms / 1000.0;
  for (auto& l : lanes_) {
    l.progress = cfg_.track_length > 0.0 ? clamp01(l.speed * t / cfg_.track_length) : 1.0;
    if (l.progress >= 1.0) {
      l.display_progress = 1.0;
    } else {
      const double surge = 1.0 + cfg_.surge * std::sin(elapsed_ms / 1000.0 + l.phase);
      l.display_progress = clamp01(l.progress * surge);
    }
    l.offset = cfg_.bob * std::sin(elapsed_ms / 200.0 + l.phase);
  }

  // Surge may not draw a duck past the winner.
  const Lane* w = winner_lane();
  if (!w) return;
  const double lead = w->display_progress;
  for (auto& l : lanes_) {
    if (!l.is_winner) l.display_progress = std::min(l.display_progress, lead);
  }
}

// ---- Marble race ----

void MarbleRaceSimulator::seed_lanes_() {
  const auto& names = participants();
  const std::size_t w = winner().index;

  lanes_.reserve(names.size());
  for (std::size_t i = 0; i < names.size(); ++i) {
    Lane l;
    l.name = names[i];
    l.index = i;
    l.is_winner = (i == w);
    l.duration_ms = l.is_winner
      ? cfg_.base_duration_ms
      : cfg_.base_duration_ms + cfg_.min_extra_ms + uniform01(rng_) * cfg_.extra_spread_ms;
    l.finish_ms = l.duration_ms;
    l.phase = uniform01(rng_) * 1000.0;
    lanes_.push_back(std::move(l));
  }
}

void MarbleRaceSimulator::advance_(double elapsed_ms) {
  for (auto& l : lanes_) {
    const double raw = l.duration_ms > 0.0 ? clamp01(elapsed_ms / l.duration_ms) : 1.0;
    l.progress = raw;
    l.display_progress = ease_in_out_quad(raw);
    l.offset = std::sin((elapsed_ms + l.phase) / 200.0) * cfg_.wobble;
  }
}

} // namespace edudraw
