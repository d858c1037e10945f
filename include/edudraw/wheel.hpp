#pragma once
#include <cstddef>
#include <optional>
#include <edudraw/easing.hpp>
#include <edudraw/simulator.hpp>

namespace edudraw {

struct WheelConfig {
  double duration_ms = 6000.0;
  int full_spins = 5;          // extra whole turns for effect
  double min_delta_deg = 1.0;  // smaller forward moves get a full extra turn
  CubicBezier easing{0.1, 0.5, 0.2, 1.0};
};

// Degrees per segment for n participants (0 when n == 0).
double wheel_segment_angle(std::size_t n);

// Absolute rotation that brings the centre of segment `winner_index` under the
// fixed pointer, moving forward from `current_deg` by the minimal delta in
// (min_delta, 360 + min_delta) plus full_spins turns.
double wheel_target_rotation(std::size_t n,
                             std::size_t winner_index,
                             double current_deg,
                             int full_spins,
                             double min_delta_deg = 1.0);

// Segment under the pointer when the wheel rests at `rotation_deg`.
// Segments are laid out clockwise from the pointer; rotating by R brings the
// segment at angle R (mod 360) under it.
std::optional<std::size_t> wheel_index_at_pointer(std::size_t n, double rotation_deg);

// Spinning wheel. Rotation is redrawn every frame from the easing curve;
// when the fixed duration elapses the wheel concludes at rest (WheelStop cue)
// and goes Done; the rest angle becomes the baseline for the next spin.
class WheelSimulator final : public Simulator {
public:
  explicit WheelSimulator(Scheduler& sched, WheelConfig cfg = {})
    : Simulator(sched), cfg_(cfg) {}

  const char* name() const override { return "wheel"; }
  const WheelConfig& config() const { return cfg_; }

  // Current visual rotation (degrees, accumulated).
  double rotation_deg() const { return rotation_deg_; }
  // Rest angle of the last completed spin.
  double baseline_deg() const { return baseline_deg_; }
  double target_deg() const { return target_deg_; }

protected:
  void on_start_() override;
  void on_cancel_() override;

private:
  void frame_();
  void stop_();

  WheelConfig cfg_;
  double rotation_deg_{0.0};
  double baseline_deg_{0.0};
  double target_deg_{0.0};
};

} // namespace edudraw
