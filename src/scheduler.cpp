#include <edudraw/scheduler.hpp>
#include <algorithm>

namespace edudraw {

TimerId ManualScheduler::after(double delay_ms, Callback fn) {
  const TimerId id = next_id_++;
  const double due = now_ms_ + std::max(0.0, delay_ms);
  auto it = std::upper_bound(timers_.begin(), timers_.end(), due,
                             [](double d, const Timer& t) { return d < t.due_ms; });
  timers_.insert(it, Timer{id, due, std::move(fn)});
  return id;
}

TimerId ManualScheduler::next_frame(Callback fn) {
  const TimerId id = next_id_++;
  frames_.push_back(FrameCb{id, std::move(fn)});
  return id;
}

bool ManualScheduler::cancel(TimerId id) {
  auto t = std::find_if(timers_.begin(), timers_.end(), [id](const Timer& x) { return x.id == id; });
  if (t != timers_.end()) { timers_.erase(t); return true; }

  auto f = std::find_if(frames_.begin(), frames_.end(), [id](const FrameCb& x) { return x.id == id; });
  if (f != frames_.end()) { frames_.erase(f); return true; }

  if (batch_) {
    for (auto& cb : *batch_) {
      if (cb.id == id && cb.fn) { cb.fn = nullptr; return true; }
    }
  }
  return false;
}

void ManualScheduler::advance_to(double t_ms) {
  while (!timers_.empty() && timers_.front().due_ms <= t_ms) {
    Timer t = std::move(timers_.front());
    timers_.erase(timers_.begin());
    now_ms_ = std::max(now_ms_, t.due_ms);
    if (t.fn) t.fn();
  }
  now_ms_ = std::max(now_ms_, t_ms);
}

void ManualScheduler::frame(double t_ms) {
  advance_to(t_ms);

  std::vector<FrameCb> batch;
  batch.swap(frames_);
  batch_ = &batch;
  for (auto& cb : batch) {
    if (!cb.fn) continue; // cancelled mid-frame
    Callback fn = std::move(cb.fn);
    cb.fn = nullptr;
    fn();
  }
  batch_ = nullptr;
}

void ManualScheduler::run_frames(double dt_ms, double until_ms) {
  if (dt_ms <= 0.0) return;
  while (now_ms_ < until_ms) {
    frame(std::min(now_ms_ + dt_ms, until_ms));
  }
}

} // namespace edudraw
