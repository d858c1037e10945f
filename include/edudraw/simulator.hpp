#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <edudraw/scheduler.hpp>

namespace edudraw {

enum class SimPhase { Idle, Running, Concluding, Done };

const char* to_string(SimPhase p);

// Moments where the host may play a sound. Fire-and-forget.
enum class AudioCue { DrawCommit, WheelStop, RaceFinish, CardReveal };

using CueSink = std::function<void(AudioCue)>;

// Predetermined winner handed to a simulator; only identity and position.
struct Winner {
  std::size_t index = 0;
  std::string name;
};

// One animation that reveals a predetermined winner.
// Idle -> Running -> Concluding -> Done. The completion callback fires once,
// on entering Done. cancel() drops every pending callback of the session and
// the completion callback never fires. start() while a session is active is
// rejected.
class Simulator {
public:
  using DoneCallback = std::function<void()>;

  explicit Simulator(Scheduler& sched) : sched_(sched) {}
  virtual ~Simulator();
  Simulator(const Simulator&) = delete;
  Simulator& operator=(const Simulator&) = delete;

  bool start(std::vector<std::string> participants, Winner winner, DoneCallback on_done);
  void cancel();

  SimPhase phase() const { return phase_; }
  bool active() const { return phase_ == SimPhase::Running || phase_ == SimPhase::Concluding; }
  std::uint64_t session() const { return session_; }

  // Time since start of the current (or last) session.
  double elapsed_ms() const;

  const std::vector<std::string>& participants() const { return participants_; }
  const Winner& winner() const { return winner_; }

  void set_cue_sink(CueSink sink) { cue_sink_ = std::move(sink); }

  virtual const char* name() const = 0;

protected:
  virtual bool accepts_(const std::vector<std::string>& participants, const Winner& winner) const;
  // Seed session state and schedule the first step.
  virtual void on_start_() = 0;
  // Release per-session buffers after cancel().
  virtual void on_cancel_() {}

  // Session-scoped scheduling: callbacks are dropped once the session ends.
  TimerId schedule_after_(double delay_ms, std::function<void()> fn);
  TimerId schedule_frame_(std::function<void()> fn);

  void conclude_();
  void finish_();
  void cue_(AudioCue cue) const;

  Scheduler& sched_;
  double start_ms_{0.0};
  double end_ms_{-1.0};

private:
  void drop_pending_();
  std::function<void()> guard_(std::function<void()> fn, const std::shared_ptr<TimerId>& slot);

  SimPhase phase_{SimPhase::Idle};
  std::uint64_t session_{0};
  std::vector<std::string> participants_;
  Winner winner_;
  DoneCallback on_done_;
  CueSink cue_sink_;
  std::vector<TimerId> pending_;
};

} // namespace edudraw
