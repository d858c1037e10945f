#include <edudraw/wheel.hpp>
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace edudraw {

static inline double wrap360(double a) {
  double w = std::fmod(a, 360.0);
  if (w < 0.0) w += 360.0;
  return w;
}

double wheel_segment_angle(std::size_t n) {
  return n == 0 ? 0.0 : 360.0 / static_cast<double>(n);
}

double wheel_target_rotation(std::size_t n,
                             std::size_t winner_index,
                             double current_deg,
                             int full_spins,
                             double min_delta_deg) {
  if (n == 0) return current_deg;
  const double seg = wheel_segment_angle(n);
  const double centre = static_cast<double>(winner_index) * seg + seg * 0.5;
  double delta = wrap360(centre - wrap360(current_deg));
  if (delta < min_delta_deg) delta += 360.0; // never a degenerate non-spin
  return current_deg + delta + 360.0 * static_cast<double>(std::max(0, full_spins));
}

std::optional<std::size_t> wheel_index_at_pointer(std::size_t n, double rotation_deg) {
  if (n == 0) return std::nullopt;
  const double seg = wheel_segment_angle(n);
  auto idx = static_cast<std::size_t>(std::floor(wrap360(rotation_deg) / seg));
  if (idx >= n) idx = n - 1;
  return idx;
}

void WheelSimulator::on_start_() {
  rotation_deg_ = baseline_deg_;
  target_deg_ = wheel_target_rotation(participants().size(), winner().index,
                                      baseline_deg_, cfg_.full_spins, cfg_.min_delta_deg);
  spdlog::debug("wheel: {:.1f} -> {:.1f} deg for #{}", baseline_deg_, target_deg_, winner().index);
  schedule_frame_([this] { frame_(); });
  schedule_after_(cfg_.duration_ms, [this] { stop_(); });
}

void WheelSimulator::on_cancel_() {
  rotation_deg_ = baseline_deg_;
}

void WheelSimulator::frame_() {
  const double p = cfg_.duration_ms > 0.0 ? elapsed_ms() / cfg_.duration_ms : 1.0;
  rotation_deg_ = baseline_deg_ + (target_deg_ - baseline_deg_) * cfg_.easing(p);
  if (p >= 1.0) {
    rotation_deg_ = target_deg_; // the duration timer takes it from here
    return;
  }
  schedule_frame_([this] { frame_(); });
}

void WheelSimulator::stop_() {
  conclude_();
  rotation_deg_ = target_deg_;
  baseline_deg_ = target_deg_;
  cue_(AudioCue::WheelStop);
  finish_();
}

} // namespace edudraw
