#pragma once
#include <cstddef>
#include <random>
#include <string>
#include <vector>
#include <edudraw/simulator.hpp>

namespace edudraw {

enum class CardStep { Idle, Shuffling, Picking, Revealed };

const char* to_string(CardStep s);

struct CardConfig {
  std::size_t deck_size = 3;
  std::size_t reveal_position = 1;  // the centre card
  double pick_at_ms = 2000.0;
  double reveal_at_ms = 3000.0;
  double done_at_ms = 5000.0;
};

// What the presentation layer should draw for one deck position.
struct CardFace {
  bool visible = true;
  bool emphasized = false;  // lifted/enlarged reveal card
  bool face_up = false;     // shows `label`
  double jitter = 0.0;      // shuffle offset in [-1, 1]
  std::string label;
};

// Fixed timeline card reveal: shuffling, picking, revealed, each step started
// by an absolute timer from session start. The winner's name is only shown on
// the reveal position once revealed.
class CardRevealSimulator final : public Simulator {
public:
  CardRevealSimulator(Scheduler& sched, std::mt19937& rng, CardConfig cfg = {});

  const char* name() const override { return "card"; }
  const CardConfig& config() const { return cfg_; }

  CardStep step() const { return step_; }
  std::size_t deck_size() const { return cfg_.deck_size; }
  CardFace face(std::size_t position) const;

protected:
  bool accepts_(const std::vector<std::string>& participants, const Winner& winner) const override;
  void on_start_() override;
  void on_cancel_() override { step_ = CardStep::Idle; }

private:
  std::mt19937& rng_;
  CardConfig cfg_;
  CardStep step_{CardStep::Idle};
  std::vector<double> shuffle_phase_;
};

} // namespace edudraw
