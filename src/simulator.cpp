#include <edudraw/simulator.hpp>
#include <algorithm>
#include <exception>
#include <spdlog/spdlog.h>

namespace edudraw {

const char* to_string(SimPhase p) {
  switch (p) {
    case SimPhase::Idle:       return "Idle";
    case SimPhase::Running:    return "Running";
    case SimPhase::Concluding: return "Concluding";
    case SimPhase::Done:       return "Done";
  }
  return "Unknown";
}

Simulator::~Simulator() {
  drop_pending_();
}

bool Simulator::accepts_(const std::vector<std::string>& participants, const Winner& winner) const {
  return !participants.empty() && winner.index < participants.size();
}

bool Simulator::start(std::vector<std::string> participants, Winner winner, DoneCallback on_done) {
  if (active()) {
    spdlog::info("{}: start rejected, session {} still {}", name(), session_, to_string(phase_));
    return false;
  }
  if (!accepts_(participants, winner)) {
    spdlog::warn("{}: start rejected, winner #{} not among {} participants",
                 name(), winner.index, participants.size());
    return false;
  }

  drop_pending_();
  ++session_;
  participants_ = std::move(participants);
  winner_ = std::move(winner);
  on_done_ = std::move(on_done);
  start_ms_ = sched_.now_ms();
  end_ms_ = -1.0;
  phase_ = SimPhase::Running;
  spdlog::debug("{}: session {} started for '{}'", name(), session_, winner_.name);

  try {
    on_start_();
  } catch (const std::exception& e) {
    spdlog::error("{}: session {} failed to start: {}", name(), session_, e.what());
    drop_pending_();
    on_done_ = nullptr;
    phase_ = SimPhase::Idle;
    throw;
  }
  return true;
}

void Simulator::cancel() {
  if (!active()) return;
  spdlog::debug("{}: session {} cancelled in {}", name(), session_, to_string(phase_));
  drop_pending_();
  on_done_ = nullptr;
  end_ms_ = sched_.now_ms();
  phase_ = SimPhase::Idle;
  on_cancel_();
}

double Simulator::elapsed_ms() const {
  if (session_ == 0) return 0.0;
  const double end = end_ms_ >= 0.0 ? end_ms_ : sched_.now_ms();
  return std::max(0.0, end - start_ms_);
}

std::function<void()> Simulator::guard_(std::function<void()> fn, const std::shared_ptr<TimerId>& slot) {
  const std::uint64_t session = session_;
  return [this, session, slot, fn = std::move(fn)]() {
    pending_.erase(std::remove(pending_.begin(), pending_.end(), *slot), pending_.end());
    if (session != session_ || !active()) return;
    fn();
  };
}

TimerId Simulator::schedule_after_(double delay_ms, std::function<void()> fn) {
  auto slot = std::make_shared<TimerId>(0);
  const TimerId id = sched_.after(delay_ms, guard_(std::move(fn), slot));
  *slot = id;
  pending_.push_back(id);
  return id;
}

TimerId Simulator::schedule_frame_(std::function<void()> fn) {
  auto slot = std::make_shared<TimerId>(0);
  const TimerId id = sched_.next_frame(guard_(std::move(fn), slot));
  *slot = id;
  pending_.push_back(id);
  return id;
}

void Simulator::conclude_() {
  if (phase_ != SimPhase::Running) return;
  phase_ = SimPhase::Concluding;
}

void Simulator::finish_() {
  if (!active()) return;
  drop_pending_();
  end_ms_ = sched_.now_ms();
  phase_ = SimPhase::Done;
  spdlog::debug("{}: session {} done after {:.0f} ms", name(), session_, end_ms_ - start_ms_);
  DoneCallback cb = std::move(on_done_);
  on_done_ = nullptr;
  if (cb) cb();
}

void Simulator::cue_(AudioCue cue) const {
  if (cue_sink_) cue_sink_(cue);
}

void Simulator::drop_pending_() {
  for (TimerId id : pending_) sched_.cancel(id);
  pending_.clear();
}

} // namespace edudraw
