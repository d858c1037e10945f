#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <set>
#include <string>
#include <vector>
#include <edudraw/orchestrator.hpp>
#include <edudraw/scheduler.hpp>

using namespace edudraw;

static AppState classroom(std::vector<std::string> names) {
  AppState s;
  s.names = std::move(names);
  s.name_pool = full_pool(s.names.size());
  return s;
}

struct Recorder {
  std::vector<std::string> notices;
  std::vector<HistoryEntry> finalized;
  std::vector<AudioCue> cues;
  int changes = 0;

  void attach(Orchestrator& o) {
    o.set_notice_sink([this](const std::string& m) { notices.push_back(m); });
    o.set_on_outcome_finalized([this](const HistoryEntry& e) { finalized.push_back(e); });
    o.set_cue_sink([this](AudioCue c) { cues.push_back(c); });
    o.set_on_state_changed([this](const AppState&) { ++changes; });
  }
};

TEST_CASE("single draws without repeats cycle through the class") {
  ManualScheduler sched;
  AppState s = classroom({"A", "B", "C"});
  s.name_no_repeat = true;
  Orchestrator orch(sched, s, 42);
  Recorder rec;
  rec.attach(orch);

  std::set<std::string> winners;
  for (int i = 0; i < 3; ++i) {
    REQUIRE(orch.request_draw() == DrawError::None);
    winners.insert(orch.result_text());
  }
  REQUIRE(winners == std::set<std::string>{"A", "B", "C"});
  REQUIRE(orch.state().history.size() == 3);
  REQUIRE(orch.state().name_pool.empty());
  REQUIRE(rec.finalized.size() == 3);
  REQUIRE(rec.finalized.back().result == orch.state().history.front().result);
  REQUIRE(rec.cues == std::vector<AudioCue>(3, AudioCue::DrawCommit));

  SECTION("the fourth draw resets the pool and draws nobody") {
    REQUIRE(orch.request_draw() == DrawError::PoolExhausted);
    REQUIRE(rec.notices.back() == "All names drawn! Resetting list.");
    REQUIRE(orch.state().name_pool == full_pool(3));
    REQUIRE(orch.state().history.size() == 3);

    REQUIRE(orch.request_draw() == DrawError::None);
    REQUIRE(orch.state().history.size() == 4);
    REQUIRE(orch.state().name_pool.size() == 2);
  }
}

TEST_CASE("paired draws") {
  ManualScheduler sched;
  AppState s = classroom({"Ann", "Ben"});
  s.mode = DrawMode::Paired;
  Orchestrator orch(sched, s, 7);
  Recorder rec;
  rec.attach(orch);

  SECTION("no tasks") {
    REQUIRE(orch.request_draw() == DrawError::NoTasksAvailable);
    REQUIRE(rec.notices.back() == "Add tasks for paired mode.");
    REQUIRE(orch.state().history.empty());
  }

  SECTION("task pool refills on its own") {
    REQUIRE(orch.add_items(ListKind::Tasks, "  Sweep the floor  ") == 1);
    REQUIRE(orch.state().tasks == std::vector<std::string>{"Sweep the floor"});
    orch.set_no_repeat(ListKind::Tasks, true);

    REQUIRE(orch.request_draw() == DrawError::None);
    REQUIRE(orch.result_text().find(" is assigned to: Sweep the floor") != std::string::npos);
    REQUIRE(orch.state().task_pool.empty());

    rec.notices.clear();
    REQUIRE(orch.request_draw() == DrawError::None);
    REQUIRE(rec.notices == std::vector<std::string>{"All tasks assigned! Resetting task list."});
    REQUIRE(orch.state().history.size() == 2);
    REQUIRE(orch.state().history.front().mode == DrawMode::Paired);
  }
}

TEST_CASE("group draws") {
  ManualScheduler sched;
  AppState s = classroom({"A", "B", "C", "D", "E"});
  s.mode = DrawMode::Groups;
  s.num_groups = 2;
  Orchestrator orch(sched, s, 9);
  Recorder rec;
  rec.attach(orch);

  REQUIRE(orch.request_draw() == DrawError::None);
  REQUIRE(orch.result_text() == "Groups Created! (2 groups)");
  const auto& h = orch.state().history.front();
  REQUIRE(h.mode == DrawMode::Groups);
  REQUIRE(h.groups.has_value());
  REQUIRE((*h.groups)[0].size() == 3);
  REQUIRE((*h.groups)[1].size() == 2);
  REQUIRE(h.result == format_groups(*h.groups));

  SECTION("too many groups") {
    orch.set_num_groups(6);
    REQUIRE(orch.request_draw() == DrawError::InsufficientItems);
    REQUIRE(rec.notices.back() == "Need at least 6 names.");
    REQUIRE(orch.state().history.size() == 1);
  }

  SECTION("group count never drops below one") {
    orch.set_num_groups(0);
    REQUIRE(orch.state().num_groups == 1);
    orch.set_num_groups(-4);
    REQUIRE(orch.state().num_groups == 1);
  }
}

TEST_CASE("interactive draws finalize when the animation ends") {
  ManualScheduler sched;
  AppState s = classroom({"Ann", "Ben", "Cat", "Dan"});
  s.mode = DrawMode::Interactive;
  s.name_no_repeat = true;

  SECTION("wheel") {
    Orchestrator orch(sched, s, 11);
    Recorder rec;
    rec.attach(orch);

    REQUIRE(orch.request_draw() == DrawError::None);
    REQUIRE(orch.session_active());
    REQUIRE(orch.result_text() == "...ANIMATING...");
    REQUIRE(orch.state().history.empty());
    REQUIRE(orch.state().name_pool.size() == 3);  // committed before the spin
    REQUIRE(orch.current_winner().has_value());
    const std::string winner = orch.current_winner()->name;

    REQUIRE(orch.request_draw() == DrawError::SessionAlreadyActive);
    REQUIRE(rec.notices.back() == "A draw is already running.");
    REQUIRE_FALSE(orch.set_visual(VisualKind::Card));
    REQUIRE(orch.state().visual == VisualKind::Wheel);

    sched.run_frames(16, 7000);
    REQUIRE_FALSE(orch.session_active());
    REQUIRE(orch.result_text() == winner);
    REQUIRE(orch.state().history.size() == 1);
    REQUIRE(orch.state().history.front().result == winner);
    REQUIRE(orch.state().history.front().mode == DrawMode::Interactive);
    REQUIRE(rec.finalized.size() == 1);
    REQUIRE(rec.cues == std::vector<AudioCue>{AudioCue::WheelStop});
    REQUIRE(wheel_index_at_pointer(4, orch.wheel().rotation_deg()) == orch.current_winner()->index);
    REQUIRE(orch.set_visual(VisualKind::Card));
  }

  SECTION("card") {
    s.visual = VisualKind::Card;
    Orchestrator orch(sched, s, 11);
    REQUIRE(orch.request_draw() == DrawError::None);
    sched.advance_to(4999);
    REQUIRE(orch.state().history.empty());
    sched.advance_to(5000);
    REQUIRE(orch.state().history.size() == 1);
    REQUIRE(orch.card().face(1).label == orch.state().history.front().result);
  }

  SECTION("duck and marble races") {
    for (auto v : {VisualKind::DuckRace, VisualKind::MarbleRace}) {
      ManualScheduler local;
      s.visual = v;
      Orchestrator orch(local, s, 13);
      REQUIRE(orch.request_draw() == DrawError::None);
      REQUIRE(orch.simulator_for(v).active());
      local.run_frames(16, 12000);
      REQUIRE(orch.state().history.size() == 1);
      REQUIRE(orch.state().history.front().result == orch.current_winner()->name);
    }
  }

  SECTION("a single name is not enough") {
    Orchestrator orch(sched, classroom({"Solo"}), 1);
    orch.set_mode(DrawMode::Interactive);
    REQUIRE(orch.request_draw() == DrawError::NotEnoughNames);
    REQUIRE_FALSE(orch.session_active());
  }
}

TEST_CASE("changing mode or lists cancels a running animation") {
  ManualScheduler sched;
  AppState s = classroom({"Ann", "Ben", "Cat"});
  s.mode = DrawMode::Interactive;
  s.visual = VisualKind::DuckRace;
  Orchestrator orch(sched, s, 21);
  Recorder rec;
  rec.attach(orch);

  REQUIRE(orch.request_draw() == DrawError::None);
  sched.run_frames(16, 1000);

  SECTION("mode change") {
    orch.set_mode(DrawMode::Single);
    REQUIRE_FALSE(orch.session_active());
    REQUIRE(orch.result_text() == "Draw cancelled.");
  }

  SECTION("explicit cancel") {
    orch.cancel_session();
    REQUIRE_FALSE(orch.session_active());
  }

  SECTION("list edit") {
    REQUIRE(orch.add_items(ListKind::Names, "Dan") == 1);
    REQUIRE_FALSE(orch.session_active());
  }

  sched.run_frames(16, 15000);
  REQUIRE(orch.state().history.empty());
  REQUIRE(rec.finalized.empty());
  REQUIRE(rec.cues.empty());
}

TEST_CASE("list management") {
  ManualScheduler sched;
  Orchestrator orch(sched, default_app_state(), 3);
  Recorder rec;
  rec.attach(orch);
  REQUIRE(orch.state().names.size() == 6);

  SECTION("add splits pasted names and skips duplicates") {
    REQUIRE(orch.add_items(ListKind::Names, "Eve\nFrank\r\n\n Eve \tJohn") == 2);
    REQUIRE(rec.notices.back() == "2 item(s) added.");
    REQUIRE(orch.state().names.size() == 8);
    REQUIRE(orch.state().names.back() == "Frank");
    REQUIRE(orch.state().name_pool == full_pool(8));

    REQUIRE(orch.add_items(ListKind::Names, "Eve") == 0);
    REQUIRE(rec.notices.back() == "Items already exist in the list.");
    REQUIRE(orch.add_items(ListKind::Names, " \n\t ") == 0);
  }

  SECTION("remove resets the pool") {
    orch.set_no_repeat(ListKind::Names, true);
    REQUIRE(orch.request_draw() == DrawError::None);
    REQUIRE(orch.state().name_pool.size() == 5);
    REQUIRE(orch.remove_item(ListKind::Names, 0));
    REQUIRE(orch.state().names.front() == "Jane");
    REQUIRE(orch.state().name_pool == full_pool(5));
    REQUIRE_FALSE(orch.remove_item(ListKind::Names, 99));
  }

  SECTION("clearing names also clears history") {
    REQUIRE(orch.request_draw() == DrawError::None);
    orch.clear_list(ListKind::Names);
    REQUIRE(orch.state().names.empty());
    REQUIRE(orch.state().history.empty());
    REQUIRE(orch.request_draw() == DrawError::EmptyList);
  }

  SECTION("shuffle keeps everyone and clears history") {
    REQUIRE(orch.request_draw() == DrawError::None);
    orch.shuffle_names();
    auto names = orch.state().names;
    std::sort(names.begin(), names.end());
    REQUIRE(names == std::vector<std::string>{"Alice", "Bob", "Charlie", "Diana", "Jane", "John"});
    REQUIRE(orch.state().history.empty());
    REQUIRE(rec.notices.back() == "Names shuffled & history cleared.");
  }

  SECTION("reset_all") {
    orch.set_no_repeat(ListKind::Names, true);
    REQUIRE(orch.request_draw() == DrawError::None);
    orch.reset_all();
    REQUIRE(orch.state().history.empty());
    REQUIRE(orch.state().name_pool == full_pool(6));
    REQUIRE(rec.notices.back() == "All pools and history reset.");
  }

  SECTION("every change bumps the version and reaches the state sink") {
    const auto v0 = orch.state().version;
    orch.set_mode(DrawMode::Groups);
    orch.set_num_groups(3);
    REQUIRE(orch.state().version == v0 + 2);
    REQUIRE(rec.changes == 2);
  }

  SECTION("history text") {
    REQUIRE(orch.request_draw() == DrawError::None);
    REQUIRE(orch.history_text().rfind("1. [", 0) == 0);
    REQUIRE(orch.history_text().find("(single): ") != std::string::npos);
  }
}

TEST_CASE("interactive draws whose animation cannot start") {
  ManualScheduler sched;
  AppState s = classroom({"Ann", "Ben", "Cat"});
  s.mode = DrawMode::Interactive;
  s.name_no_repeat = true;

  SECTION("card with a blank winner name") {
    s.names = {"", ""};
    s.name_pool = full_pool(2);
    s.visual = VisualKind::Card;
    Orchestrator orch(sched, s, 5);
    Recorder rec;
    rec.attach(orch);

    REQUIRE(orch.request_draw() == DrawError::AnimationFailed);
    REQUIRE(rec.notices.back() == "Could not start the animation.");
    REQUIRE_FALSE(orch.session_active());
    REQUIRE(orch.state().name_pool == full_pool(2));
    REQUIRE(orch.result_text() == "Click 'DRAW LOTS' to begin!");
    REQUIRE(orch.state().history.empty());
  }

  SECTION("race tuning that lets the winner be caught") {
    s.visual = VisualKind::DuckRace;
    SimTuning tuning;
    tuning.duck.winner_boost = 1.0;
    Orchestrator orch(sched, s, 5, tuning);
    Recorder rec;
    rec.attach(orch);

    REQUIRE(orch.request_draw() == DrawError::AnimationFailed);
    REQUIRE(rec.notices.back() == "Could not start the animation.");
    REQUIRE_FALSE(orch.session_active());
    REQUIRE(orch.state().name_pool == full_pool(3));
    REQUIRE(sched.idle());
    REQUIRE(rec.changes == 0);
  }
}
