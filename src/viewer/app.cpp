#include <raylib.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include <edudraw/viewer/app.hpp>
#include <edudraw/orchestrator.hpp>
#include <edudraw/scheduler.hpp>
#include <edudraw/wheel.hpp>

namespace edudraw {

namespace {

static constexpr float kPI = 3.14159265358979323846f;

// Segment / lane palette; assigned by list position.
static Color colorFor(std::size_t i) {
  static const Color PAL[] = {
    {251, 146, 60, 255},   // orange
    {167, 139, 250, 255},  // purple
    {52, 211, 153, 255},   // emerald
    {248, 113, 113, 255},  // red
    {96, 165, 250, 255},   // blue
    {253, 224, 71, 255},   // yellow
    {232, 121, 249, 255},  // fuchsia
    {74, 222, 128, 255},   // green
  };
  return PAL[i % (sizeof(PAL) / sizeof(PAL[0]))];
}

static const Color kInk     = {55, 65, 81, 255};
static const Color kIndigo  = {67, 56, 202, 255};
static const Color kPanel   = {255, 255, 255, 235};
static const Color kMuted   = {156, 163, 175, 255};

// --- Layout (keep in sync with draw_hud_) ---
static constexpr int kHUD_LINE1_Y = 12;  // size 20
static constexpr int kHUD_LINE2_Y = 38;  // size 16
static constexpr int kHUD_LINE3_Y = 60;  // size 14
static constexpr int kPANEL_TOP   = 90;
static constexpr int kLIST_W      = 240;
static constexpr int kHIST_W      = 300;

static constexpr int kBeepRate = 44100;

static void drawCentered(const char* text, float cx, float y, int size, Color c) {
  DrawText(text, int(cx) - MeasureText(text, size) / 2, int(y), size, c);
}

static void drawBanner(const char* title, const std::string& who, float cx, float cy, Color accent) {
  const float w = 320.0f, h = 110.0f;
  DrawRectangle(int(cx - w / 2), int(cy - h / 2), int(w), int(h), Color{255, 255, 255, 242});
  DrawRectangleLinesEx(Rectangle{cx - w / 2, cy - h / 2, w, h}, 5.0f, accent);
  drawCentered(title, cx, cy - 36, 28, accent);
  std::string upper = who;
  for (auto& ch : upper) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
  drawCentered(upper.c_str(), cx, cy + 4, 26, kInk);
}

// 880 Hz sine, 100 ms, short attack/release.
static Sound makeBeep() {
  const int frames = kBeepRate / 10;
  std::vector<std::int16_t> pcm(static_cast<std::size_t>(frames));
  for (int i = 0; i < frames; ++i) {
    const float t = float(i) / float(kBeepRate);
    const float attack = std::min(1.0f, t / 0.02f);
    const float release = std::min(1.0f, (0.1f - t) / 0.08f);
    const float env = 0.5f * std::max(0.0f, std::min(attack, release));
    pcm[static_cast<std::size_t>(i)] = static_cast<std::int16_t>(env * 32767.0f * std::sin(2.0f * kPI * 880.0f * t));
  }
  Wave w{};
  w.frameCount = static_cast<unsigned int>(frames);
  w.sampleRate = kBeepRate;
  w.sampleSize = 16;
  w.channels = 1;
  w.data = pcm.data();
  return LoadSoundFromWave(w); // copies the samples
}

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(Orchestrator& orch, ManualScheduler& sched) : orch_(orch), sched_(sched) {}

void ViewerApp::notify(const std::string& msg) {
  // Deadline is set on first display; notices can arrive before the window opens.
  toast_ = msg;
  toast_until_s_ = -1.0;
}

void ViewerApp::beep() {
  beep_pending_ = true;
}

ViewerApp::Rectf ViewerApp::stage_rect_() const {
  const float x = float(kLIST_W + 30);
  const float y = float(kPANEL_TOP);
  const float w = float(GetScreenWidth() - kLIST_W - kHIST_W - 60);
  const float h = float(GetScreenHeight() - kPANEL_TOP - 110);
  return {x, y, w, h};
}

int ViewerApp::run() {
  const int W = 1280, H = 800;
  SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_MSAA_4X_HINT);
  InitWindow(W, H, "EduDraw");
  SetTargetFPS(60);
  InitAudioDevice();
  audio_ready_ = IsAudioDeviceReady();
  Sound tone{};
  if (audio_ready_) tone = makeBeep();

  while (!WindowShouldClose()) {
    process_input_();
    pump_scheduler_();
    if (beep_pending_) {
      beep_pending_ = false;
      if (audio_ready_) PlaySound(tone);
    }
    render_frame_();
  }

  orch_.cancel_session();
  if (audio_ready_) {
    UnloadSound(tone);
    CloseAudioDevice();
  }
  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  if (IsKeyPressed(KEY_SPACE) || IsKeyPressed(KEY_ENTER)) orch_.request_draw();

  // Mode / visualization cycling
  if (IsKeyPressed(KEY_M)) {
    const int next = (static_cast<int>(orch_.state().mode) + 1) % static_cast<int>(DrawMode::Count);
    orch_.set_mode(static_cast<DrawMode>(next));
  }
  const bool ctrl = IsKeyDown(KEY_LEFT_CONTROL) || IsKeyDown(KEY_RIGHT_CONTROL);
  if (IsKeyPressed(KEY_V) && !ctrl) {
    const int next = (static_cast<int>(orch_.state().visual) + 1) % static_cast<int>(VisualKind::Count);
    if (!orch_.set_visual(static_cast<VisualKind>(next))) notify("Wait for the animation to finish.");
  }

  // Group count
  if (IsKeyPressed(KEY_LEFT_BRACKET))  orch_.set_num_groups(orch_.state().num_groups - 1);
  if (IsKeyPressed(KEY_RIGHT_BRACKET)) orch_.set_num_groups(orch_.state().num_groups + 1);

  // No-repeat toggles
  if (IsKeyPressed(KEY_N)) orch_.set_no_repeat(ListKind::Names, !orch_.state().name_no_repeat);
  if (IsKeyPressed(KEY_T)) orch_.set_no_repeat(ListKind::Tasks, !orch_.state().task_no_repeat);

  if (IsKeyPressed(KEY_S)) orch_.shuffle_names();
  if (IsKeyPressed(KEY_R)) orch_.reset_all();
  if (IsKeyPressed(KEY_X)) orch_.cancel_session();

  // Paste names from the clipboard (one per line)
  if (ctrl && IsKeyPressed(KEY_V)) {
    if (const char* clip = GetClipboardText()) orch_.add_items(ListKind::Names, clip);
  }
  if (IsKeyPressed(KEY_C)) {
    const std::string text = orch_.history_text();
    SetClipboardText(text.c_str());
    notify("Copied to clipboard!");
  }
}

void ViewerApp::pump_scheduler_() {
  // Timers first, then one animation frame at the window clock.
  sched_.frame(GetTime() * 1000.0);
}

void ViewerApp::render_frame_() {
  BeginDrawing();
  ClearBackground(Color{249, 250, 251, 255});

  draw_hud_();
  draw_lists_();
  draw_stage_();
  draw_result_();
  draw_history_();
  draw_toast_();

  EndDrawing();
}

void ViewerApp::draw_hud_() {
  const auto& s = orch_.state();
  DrawText("EduDraw", 20, kHUD_LINE1_Y, 24, kIndigo);

  char line[256];
  std::snprintf(line, sizeof(line), "mode=%s  visual=%s  groups=%d  names=%zu%s  tasks=%zu%s",
                display_name(s.mode), display_name(s.visual), s.num_groups,
                s.names.size(), s.name_no_repeat ? " (no-repeat)" : "",
                s.tasks.size(), s.task_no_repeat ? " (no-repeat)" : "");
  DrawText(line, 160, kHUD_LINE1_Y + 4, 18, kInk);

  const char* action = s.mode == DrawMode::Groups ? "CREATE GROUPS"
                     : s.mode == DrawMode::Interactive ? "START INTERACTIVE DRAW"
                                                       : "DRAW LOTS";
  DrawText(TextFormat("Space/Enter: %s%s", action, orch_.session_active() ? "  (animating...)" : ""),
           20, kHUD_LINE2_Y, 16, kIndigo);

  DrawText("M: Mode | V: Visual | [ ]: Groups | N/T: No-repeat names/tasks | S: Shuffle | R: Reset | X: Stop | Ctrl+V: Paste names | C: Copy history",
           20, kHUD_LINE3_Y, 14, kMuted);
}

void ViewerApp::draw_lists_() {
  const auto& s = orch_.state();
  const int x0 = 20;
  int y = kPANEL_TOP;

  auto draw_list = [&](const char* title, ListKind kind) {
    const auto& items = s.list(kind);
    DrawText(title, x0, y, 18, kIndigo);
    y += 24;
    if (items.empty()) {
      DrawText("(empty)", x0 + 6, y, 14, kMuted);
      y += 20;
    }
    for (std::size_t i = 0; i < items.size() && y < GetScreenHeight() - 40; ++i) {
      const bool used = is_drawn(s.pool(kind), i, s.no_repeat(kind));
      DrawRectangle(x0, y, kLIST_W, 20, used ? Color{229, 231, 235, 255} : kPanel);
      const Color c = used ? kMuted : kInk;
      DrawText(items[i].c_str(), x0 + 6, y + 3, 14, c);
      if (used) {
        const int w = MeasureText(items[i].c_str(), 14);
        DrawLine(x0 + 6, y + 10, x0 + 6 + w, y + 10, kMuted);
      }
      y += 22;
    }
    y += 12;
  };

  draw_list("Names", ListKind::Names);
  if (s.mode == DrawMode::Paired) draw_list("Tasks", ListKind::Tasks);
}

void ViewerApp::draw_history_() {
  const auto& hist = orch_.state().history;
  const int x0 = GetScreenWidth() - kHIST_W - 20;
  int y = kPANEL_TOP;
  DrawText("History", x0, y, 18, kIndigo);
  y += 24;
  if (hist.empty()) DrawText("No draws yet.", x0, y, 14, kMuted);
  for (std::size_t i = 0; i < hist.size() && y < GetScreenHeight() - 20; ++i) {
    const auto& h = hist[i];
    DrawText(TextFormat("%2zu. [%s] (%s)", i + 1, h.timestamp.c_str(), to_string(h.mode)), x0, y, 12, kMuted);
    y += 14;
    if (h.groups) {
      for (std::size_t g = 0; g < h.groups->size() && y < GetScreenHeight() - 20; ++g) {
        std::string line = "Group " + std::to_string(g + 1) + ": ";
        for (std::size_t k = 0; k < (*h.groups)[g].size(); ++k) {
          if (k > 0) line += ", ";
          line += (*h.groups)[g][k];
        }
        DrawText(line.c_str(), x0 + 10, y, 13, kInk);
        y += 16;
      }
    } else {
      DrawText(h.result.c_str(), x0 + 10, y, 14, kInk);
      y += 18;
    }
    y += 4;
  }
}

void ViewerApp::draw_result_() {
  const Rectf st = stage_rect_();
  const float y = st.y + st.h + 20.0f;
  DrawRectangle(int(st.x), int(y), int(st.w), 70, kPanel);
  DrawRectangleLines(int(st.x), int(y), int(st.w), 70, Color{199, 210, 254, 255});
  drawCentered(orch_.result_text().c_str(), st.x + st.w * 0.5f, y + 22, 26, kIndigo);
}

void ViewerApp::draw_stage_() {
  const Rectf st = stage_rect_();
  if (orch_.state().mode != DrawMode::Interactive) {
    DrawRectangle(int(st.x), int(st.y), int(st.w), int(st.h), Color{238, 242, 255, 255});
    drawCentered(display_name(orch_.state().mode), st.x + st.w * 0.5f, st.y + st.h * 0.5f - 20, 40,
                 Color{199, 210, 254, 255});
    return;
  }
  switch (orch_.state().visual) {
    case VisualKind::Wheel:      draw_wheel_(); break;
    case VisualKind::DuckRace:   draw_duck_race_(); break;
    case VisualKind::MarbleRace: draw_marble_race_(); break;
    case VisualKind::Card:       draw_cards_(); break;
    default: break;
  }
}

void ViewerApp::draw_wheel_() {
  const Rectf st = stage_rect_();
  const auto& names = orch_.state().names;
  if (names.empty()) return;

  const Vector2 c{st.x + st.w * 0.5f, st.y + st.h * 0.5f};
  const float radius = std::min(st.w, st.h) * 0.45f;
  const float seg = float(wheel_segment_angle(names.size()));
  const float rot = float(std::fmod(orch_.wheel().rotation_deg(), 360.0));

  // Segments clockwise from 12 o'clock; the wheel turns by -rotation.
  for (std::size_t i = 0; i < names.size(); ++i) {
    const float a0 = float(i) * seg - 90.0f - rot;
    const float a1 = a0 + seg;
    DrawCircleSector(c, radius, a0, a1, 48, colorFor(i));
    DrawCircleSectorLines(c, radius, a0, a1, 48, WHITE);

    const float mid = (a0 + a1) * 0.5f * kPI / 180.0f;
    const float tr = radius * 0.72f;
    const int size = seg > 30.0f ? 18 : 13;
    const char* label = names[i].c_str();
    DrawText(label, int(c.x + std::cos(mid) * tr) - MeasureText(label, size) / 2,
             int(c.y + std::sin(mid) * tr) - size / 2, size, kInk);
  }

  // Hub and fixed pointer
  DrawCircleV(c, 24.0f, Color{31, 41, 55, 255});
  DrawCircleLines(int(c.x), int(c.y), 24.0f, Color{229, 231, 235, 255});
  DrawTriangle(Vector2{c.x, c.y - radius + 26.0f}, Vector2{c.x + 15.0f, c.y - radius - 6.0f},
               Vector2{c.x - 15.0f, c.y - radius - 6.0f}, Color{239, 68, 68, 255});
}

void ViewerApp::draw_duck_race_() {
  const Rectf st = stage_rect_();
  const auto& race = orch_.duck_race();

  // Water
  DrawRectangleGradientV(int(st.x), int(st.y), int(st.w), int(st.h), Color{129, 199, 255, 255}, Color{66, 165, 245, 255});
  const float t = float(GetTime());
  for (float y = st.y + 10.0f; y < st.y + st.h; y += 40.0f) {
    Vector2 prev{st.x, y};
    for (float x = st.x + 20.0f; x <= st.x + st.w; x += 20.0f) {
      Vector2 p{x, y + std::sin(x * 0.1f + t * 6.0f) * 3.0f};
      DrawLineV(prev, p, Color{255, 255, 255, 100});
      prev = p;
    }
  }

  const float start_x = st.x + 50.0f;
  const float finish_x = st.x + st.w * 0.95f - 40.0f;
  for (float y = st.y; y < st.y + st.h; y += 15.0f) {
    DrawLineEx(Vector2{finish_x + 40.0f, y}, Vector2{finish_x + 40.0f, y + 10.0f}, 4.0f, Color{239, 68, 68, 255});
  }
  drawCentered("FINISH", finish_x + 40.0f, st.y + 10.0f, 18, Color{239, 68, 68, 255});

  const auto& lanes = race.lanes();
  if (lanes.empty()) return;
  const float lane_h = st.h / float(lanes.size() + 1);
  const float size = std::min(20.0f, lane_h * 0.35f);
  for (const auto& l : lanes) {
    const float x = start_x + float(l.display_progress) * (finish_x - start_x);
    const float y = st.y + lane_h * float(l.index + 1) + float(l.offset) * lane_h;
    const Color body = colorFor(l.index);
    DrawEllipse(int(x), int(y), size * 1.5f, size * 0.8f, body);
    DrawCircleV(Vector2{x + size * 0.8f, y - size * 0.4f}, size * 0.6f, body);
    DrawCircleV(Vector2{x + size * 1.1f, y - size * 0.5f}, size * 0.1f, Color{31, 41, 55, 255});
    DrawTriangle(Vector2{x + size * 1.4f, y - size * 0.4f}, Vector2{x + size * 1.4f, y - size * 0.1f},
                 Vector2{x + size * 2.0f, y - size * 0.3f}, Color{255, 179, 0, 255});
    drawCentered(l.name.c_str(), x, y - size * 1.8f - 8.0f, 14, Color{31, 41, 55, 255});
  }

  if (race.winner_declared()) {
    drawBanner("WINNER:", race.winner().name, st.x + st.w * 0.5f, st.y + st.h * 0.5f, Color{16, 185, 129, 255});
  }
}

void ViewerApp::draw_marble_race_() {
  const Rectf st = stage_rect_();
  const auto& race = orch_.marble_race();
  const auto& lanes = race.lanes();

  DrawRectangleGradientV(int(st.x), int(st.y), int(st.w), int(st.h), Color{49, 46, 129, 255}, Color{67, 56, 202, 255});
  const float pad = 40.0f;
  const float finish_y = st.y + st.h - 50.0f;
  for (int i = 0; float(i) * 10.0f < st.w; ++i) {
    DrawRectangle(int(st.x) + i * 10, int(finish_y), 10, 10, (i % 2 == 0) ? WHITE : BLACK);
  }
  drawCentered("FINISH", st.x + st.w * 0.5f, finish_y + 18.0f, 20, WHITE);

  if (lanes.empty()) {
    drawCentered("Press Space to Race", st.x + st.w * 0.5f, st.y + st.h * 0.5f, 20, Color{255, 255, 255, 40});
    return;
  }

  const float lane_w = (st.w - pad * 2.0f) / float(lanes.size());
  const float r = std::max(4.0f, std::min(15.0f, lane_w * 0.5f));
  for (std::size_t i = 0; i <= lanes.size(); ++i) {
    const float x = st.x + pad + float(i) * lane_w;
    DrawLineV(Vector2{x, st.y}, Vector2{x, st.y + st.h}, Color{255, 255, 255, 25});
  }
  for (const auto& l : lanes) {
    const float y0 = st.y + r;
    const float y1 = finish_y - r;
    const float x = st.x + pad + float(l.index) * lane_w + lane_w * 0.5f + float(l.offset) * lane_w;
    const float y = y0 + (y1 - y0) * float(l.display_progress);
    DrawCircleV(Vector2{x + 2.0f, y + 2.0f}, r, Color{0, 0, 0, 76});
    DrawCircleV(Vector2{x, y}, r, colorFor(l.index));
    DrawCircleLines(int(x), int(y), r, WHITE);
    DrawCircleV(Vector2{x - r * 0.3f, y - r * 0.3f}, r * 0.4f, Color{255, 255, 255, 100});
    drawCentered(l.name.c_str(), x, y - r - 16.0f, 12, WHITE);
  }

  if (race.winner_declared()) {
    drawBanner("WINNER", race.winner().name, st.x + st.w * 0.5f, st.y + st.h * 0.5f, Color{245, 158, 11, 255});
  }
}

void ViewerApp::draw_cards_() {
  const Rectf st = stage_rect_();
  const auto& card = orch_.card();
  DrawRectangle(int(st.x), int(st.y), int(st.w), int(st.h), Color{243, 244, 246, 255});

  const CardStep step = card.step();
  if (step == CardStep::Idle) drawCentered("Lucky Card Draw", st.x + st.w * 0.5f, st.y + 30.0f, 26, kIndigo);

  const float cw = 128.0f, ch = 192.0f, gap = 32.0f;
  const float total = float(card.deck_size()) * cw + float(card.deck_size() - 1) * gap;
  const float x0 = st.x + (st.w - total) * 0.5f;
  const float y0 = st.y + (st.h - ch) * 0.5f;

  for (std::size_t i = 0; i < card.deck_size(); ++i) {
    const CardFace f = card.face(i);
    if (!f.visible) continue;
    const float scale = f.emphasized ? 1.25f : 1.0f;
    const float w = cw * scale, h = ch * scale;
    const float cx = x0 + float(i) * (cw + gap) + cw * 0.5f + float(f.jitter) * 12.0f;
    const float cy = y0 + ch * 0.5f - (f.emphasized ? 20.0f : 0.0f);
    const Rectangle r{cx - w * 0.5f, cy - h * 0.5f, w, h};
    if (f.face_up) {
      DrawRectangleRounded(r, 0.12f, 8, WHITE);
      DrawRectangleLinesEx(r, 4.0f, Color{250, 204, 21, 255});
      drawCentered("WINNER", cx, cy - 30.0f, 12, kMuted);
      drawCentered(f.label.c_str(), cx, cy - 6.0f, 20, Color{55, 48, 163, 255});
    } else {
      DrawRectangleRounded(r, 0.12f, 8, Color{109, 40, 217, 255});
      drawCentered("?", cx, cy - 20.0f, 40, WHITE);
    }
  }

  if (step == CardStep::Shuffling) drawCentered("Shuffling...", st.x + st.w * 0.5f, st.y + st.h - 60.0f, 20, Color{99, 102, 241, 255});
  if (step == CardStep::Revealed)  drawCentered("Congratulations!", st.x + st.w * 0.5f, st.y + st.h - 60.0f, 22, Color{202, 138, 4, 255});
}

void ViewerApp::draw_toast_() {
  if (toast_.empty()) return;
  if (toast_until_s_ < 0.0) toast_until_s_ = GetTime() + 3.0;
  if (GetTime() > toast_until_s_) return;
  const int w = MeasureText(toast_.c_str(), 18) + 32;
  const int x = GetScreenWidth() / 2 - w / 2;
  DrawRectangle(x, 8, w, 32, Color{250, 204, 21, 255});
  DrawText(toast_.c_str(), x + 16, 15, 18, Color{113, 63, 18, 255});
}

} // namespace edudraw
