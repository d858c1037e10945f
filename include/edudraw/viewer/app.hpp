#pragma once
#include <string>

namespace edudraw {

class Orchestrator;
class ManualScheduler;

// RAII application that drives the scheduler from the window clock and
// renders lists, history, the result card and the active animation.
class ViewerApp {
public:
  ViewerApp(Orchestrator& orch, ManualScheduler& sched);
  int run(); // returns 0 on normal exit

  // Transient notice shown at the top of the window.
  void notify(const std::string& msg);
  // Short tone for draw/finish/reveal moments.
  void beep();

private:
  // Input & time
  void process_input_();
  void pump_scheduler_();
  // Rendering
  void render_frame_();
  void draw_lists_();
  void draw_history_();
  void draw_hud_();
  void draw_result_();
  void draw_stage_();
  void draw_wheel_();
  void draw_duck_race_();
  void draw_marble_race_();
  void draw_cards_();
  void draw_toast_();

  struct Rectf { float x; float y; float w; float h; };
  Rectf stage_rect_() const;

  // Dependencies
  Orchestrator& orch_;
  ManualScheduler& sched_;

  // UI state
  std::string toast_;
  double toast_until_s_{0.0};
  bool audio_ready_{false};
  bool beep_pending_{false};
};

} // namespace edudraw
