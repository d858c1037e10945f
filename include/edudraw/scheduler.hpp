#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace edudraw {

using TimerId = std::uint64_t;

// Host event queue seen by the simulators: a clock, one-shot timers and
// "before next frame" callbacks. Single-threaded; callbacks never overlap.
class Scheduler {
public:
  using Callback = std::function<void()>;

  virtual ~Scheduler() = default;

  virtual double now_ms() const = 0;
  virtual TimerId after(double delay_ms, Callback fn) = 0;
  virtual TimerId next_frame(Callback fn) = 0;
  // Returns false if the id already fired or was never issued.
  virtual bool cancel(TimerId id) = 0;
};

// Scheduler driven explicitly by its owner. Tests step it with fake time;
// the viewer feeds it the window clock once per rendered frame.
class ManualScheduler final : public Scheduler {
public:
  explicit ManualScheduler(double start_ms = 0.0) : now_ms_(start_ms) {}

  double now_ms() const override { return now_ms_; }
  TimerId after(double delay_ms, Callback fn) override;
  TimerId next_frame(Callback fn) override;
  bool cancel(TimerId id) override;

  // Fire timers due at or before t_ms in (due, issue order); the clock never
  // moves backwards.
  void advance_to(double t_ms);
  void advance_by(double dt_ms) { advance_to(now_ms_ + dt_ms); }

  // One animation frame at t_ms: due timers first, then the frame callbacks
  // that were registered before this frame began.
  void frame(double t_ms);

  // Frames every dt_ms until the clock reaches until_ms.
  void run_frames(double dt_ms, double until_ms);

  std::size_t pending_timers() const { return timers_.size(); }
  std::size_t pending_frames() const { return frames_.size(); }
  bool idle() const { return timers_.empty() && frames_.empty(); }

private:
  struct Timer {
    TimerId id;
    double due_ms;
    Callback fn;
  };
  struct FrameCb {
    TimerId id;
    Callback fn;
  };

  std::vector<Timer> timers_;   // sorted by (due_ms, id)
  std::vector<FrameCb> frames_;
  std::vector<FrameCb>* batch_{nullptr}; // frame callbacks currently running
  double now_ms_{0.0};
  TimerId next_id_{1};
};

} // namespace edudraw
