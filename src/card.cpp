#include <edudraw/card.hpp>
#include <cmath>
#include <edudraw/random.hpp>

namespace edudraw {

const char* to_string(CardStep s) {
  switch (s) {
    case CardStep::Idle:      return "idle";
    case CardStep::Shuffling: return "shuffling";
    case CardStep::Picking:   return "picking";
    case CardStep::Revealed:  return "revealed";
  }
  return "unknown";
}

CardRevealSimulator::CardRevealSimulator(Scheduler& sched, std::mt19937& rng, CardConfig cfg)
  : Simulator(sched), rng_(rng), cfg_(cfg) {
  if (cfg_.deck_size == 0) cfg_.deck_size = 1;
  if (cfg_.reveal_position >= cfg_.deck_size) cfg_.reveal_position = cfg_.deck_size / 2;
}

bool CardRevealSimulator::accepts_(const std::vector<std::string>&, const Winner& winner) const {
  // Only the winner's name is displayed; the list size does not matter.
  return !winner.name.empty();
}

void CardRevealSimulator::on_start_() {
  step_ = CardStep::Shuffling;
  shuffle_phase_.assign(cfg_.deck_size, 0.0);
  for (auto& p : shuffle_phase_) p = uniform01(rng_) * 6.283185307179586;

  schedule_after_(cfg_.pick_at_ms, [this] { step_ = CardStep::Picking; });
  schedule_after_(cfg_.reveal_at_ms, [this] {
    step_ = CardStep::Revealed;
    conclude_();
    cue_(AudioCue::CardReveal);
  });
  schedule_after_(cfg_.done_at_ms, [this] { finish_(); });
}

CardFace CardRevealSimulator::face(std::size_t position) const {
  CardFace f;
  if (position >= cfg_.deck_size) { f.visible = false; return f; }
  const bool is_reveal = (position == cfg_.reveal_position);

  switch (step_) {
    case CardStep::Idle:
      break;
    case CardStep::Shuffling: {
      const double ph = position < shuffle_phase_.size() ? shuffle_phase_[position] : 0.0;
      f.jitter = std::sin(elapsed_ms() / 150.0 + ph);
      break;
    }
    case CardStep::Picking:
      f.visible = is_reveal;
      f.emphasized = is_reveal;
      break;
    case CardStep::Revealed:
      f.visible = is_reveal;
      f.emphasized = is_reveal;
      f.face_up = is_reveal;
      if (is_reveal) f.label = winner().name;
      break;
  }
  return f;
}

} // namespace edudraw
