#include <cstring>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <edudraw/log.hpp>
#include <edudraw/orchestrator.hpp>
#include <edudraw/persist.hpp>
#include <edudraw/scheduler.hpp>
#include <edudraw/viewer/app.hpp>

using namespace edudraw;

// Usage: edudraw_viewer [--state-dir DIR] [--task TASK]... [NAME]...
int main(int argc, char** argv) {
  init_logging();

  std::filesystem::path dir = default_state_dir();
  std::vector<std::string> names;
  std::vector<std::string> tasks;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--state-dir") == 0 && i + 1 < argc) dir = argv[++i];
    else if (std::strcmp(argv[i], "--task") == 0 && i + 1 < argc) tasks.emplace_back(argv[++i]);
    else names.emplace_back(argv[i]);
  }

  const auto file = state_file_path(dir);
  AppState initial = load_state(file, default_app_state()).value_or(default_app_state());

  ManualScheduler sched;
  Orchestrator orch(sched, std::move(initial));

  ViewerApp app(orch, sched);
  orch.set_notice_sink([&app](const std::string& msg) { app.notify(msg); });
  orch.set_cue_sink([&app](AudioCue) { app.beep(); });
  orch.set_on_state_changed([file](const AppState& s) {
    if (!save_state(file, s)) spdlog::debug("state v{} not persisted", s.version);
  });

  for (const auto& n : names) orch.add_items(ListKind::Names, n);
  for (const auto& t : tasks) orch.add_items(ListKind::Tasks, t);

  spdlog::info("state file: {}", file.string());
  return app.run();
}
