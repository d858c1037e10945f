#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <edudraw/persist.hpp>

using namespace edudraw;

static AppState sample_state() {
  AppState s = default_app_state();
  s.version = 12;
  s.tasks = {"Sweep", "Water plants"};
  s.name_no_repeat = true;
  s.name_pool = {0, 2, 5};
  s.task_no_repeat = true;
  s.task_pool = {1};
  s.mode = DrawMode::Interactive;
  s.visual = VisualKind::DuckRace;
  s.num_groups = 3;

  HistoryEntry g;
  g.id = 200;
  g.result = "Group 1: John | Group 2: Jane";
  g.mode = DrawMode::Groups;
  g.timestamp = "09:15:00";
  g.groups = std::vector<Group>{{"John"}, {"Jane"}};
  HistoryEntry a;
  a.id = 100;
  a.result = "Alice";
  a.mode = DrawMode::Single;
  a.timestamp = "09:14:00";
  s.history = {g, a};
  return s;
}

TEST_CASE("saved state uses the stored field names") {
  const auto j = nlohmann::json::parse(state_to_json(sample_state()));
  REQUIRE(j.at("isNameNoRepeat").get<bool>());
  REQUIRE(j.at("availableNamesIndices").get<std::vector<int>>() == std::vector<int>{0, 2, 5});
  REQUIRE(j.at("availableTasksIndices").get<std::vector<int>>() == std::vector<int>{1});
  REQUIRE(j.at("mode").get<std::string>() == "interactive");
  REQUIRE(j.at("interactiveMode").get<std::string>() == "race");
  REQUIRE(j.at("numGroups").get<int>() == 3);
  REQUIRE(j.at("history").size() == 2);
  REQUIRE(j.at("history").at(0).at("groups").at(1).at(0).get<std::string>() == "Jane");
  REQUIRE_FALSE(j.at("history").at(1).contains("groups"));
}

TEST_CASE("state survives a save and reload") {
  const AppState s = sample_state();
  std::istringstream in(state_to_json(s));
  auto back = state_from_json_stream(in, AppState{});
  REQUIRE(back.has_value());
  REQUIRE(back->version == 12);
  REQUIRE(back->names == s.names);
  REQUIRE(back->tasks == s.tasks);
  REQUIRE(back->name_pool == s.name_pool);
  REQUIRE(back->task_pool == s.task_pool);
  REQUIRE(back->name_no_repeat);
  REQUIRE(back->task_no_repeat);
  REQUIRE(back->mode == DrawMode::Interactive);
  REQUIRE(back->visual == VisualKind::DuckRace);
  REQUIRE(back->num_groups == 3);
  REQUIRE(back->history.size() == 2);
  REQUIRE(back->history[0].id == 200);
  REQUIRE(back->history[0].groups.has_value());
  REQUIRE(back->history[1].result == "Alice");
  REQUIRE_FALSE(back->history[1].groups.has_value());
}

TEST_CASE("loading tolerates partial and broken documents") {
  const AppState defaults = default_app_state();

  SECTION("missing fields keep their defaults") {
    std::istringstream in(R"({"names": ["X", "Y"], "mode": "bogus", "numGroups": 0})");
    auto s = state_from_json_stream(in, defaults);
    REQUIRE(s.has_value());
    REQUIRE(s->names == std::vector<std::string>{"X", "Y"});
    REQUIRE(s->mode == defaults.mode);
    REQUIRE(s->visual == defaults.visual);
    REQUIRE(s->num_groups == 1);
  }

  SECTION("negative and non-integer pool entries are dropped") {
    std::istringstream in(R"({"availableNamesIndices": [3, -1, "two", 1.5, 0]})");
    auto s = state_from_json_stream(in, defaults);
    REQUIRE(s.has_value());
    REQUIRE(s->name_pool == IndexPool{3, 0});
  }

  SECTION("not JSON") {
    std::istringstream in("{ names: oops");
    REQUIRE_FALSE(state_from_json_stream(in, defaults).has_value());
  }

  SECTION("not an object") {
    std::istringstream in("[1, 2, 3]");
    REQUIRE_FALSE(state_from_json_stream(in, defaults).has_value());
  }

  SECTION("wrong field type") {
    std::istringstream in(R"({"names": 5})");
    REQUIRE_FALSE(state_from_json_stream(in, defaults).has_value());
  }

  SECTION("history longer than the cap is truncated") {
    nlohmann::json j;
    j["history"] = nlohmann::json::array();
    for (int i = 0; i < 70; ++i) j["history"].push_back({{"id", 70 - i}, {"result", "r"}, {"mode", "single"}});
    std::istringstream in(j.dump());
    auto s = state_from_json_stream(in, defaults);
    REQUIRE(s.has_value());
    REQUIRE(s->history.size() == kMaxHistory);
    REQUIRE(s->history.front().id == 70);
  }
}

TEST_CASE("save_state and load_state on disk") {
  std::random_device rd;
  const auto dir = std::filesystem::temp_directory_path() / ("edudraw_test_" + std::to_string(rd()));
  const auto file = state_file_path(dir / "nested");
  REQUIRE(std::string(kStorageKey) == "drawLotsGeneratorState");
  REQUIRE(file.filename().string() == "drawLotsGeneratorState.json");

  REQUIRE_FALSE(load_state(file, AppState{}).has_value());

  REQUIRE(save_state(file, sample_state()));
  auto back = load_state(file, AppState{});
  REQUIRE(back.has_value());
  REQUIRE(back->names == sample_state().names);

  {
    std::ofstream out(file, std::ios::trunc);
    out << "garbage";
  }
  REQUIRE_FALSE(load_state(file, AppState{}).has_value());

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}

TEST_CASE("mode and visual keys") {
  REQUIRE(draw_mode_from_string("paired") == DrawMode::Paired);
  REQUIRE(visual_from_string("marble") == VisualKind::MarbleRace);
  REQUIRE(visual_from_string("card") == VisualKind::Card);
  REQUIRE_FALSE(visual_from_string("slots").has_value());
  REQUIRE(std::string(to_string(VisualKind::Wheel)) == "wheel");
  REQUIRE(std::string(display_name(VisualKind::DuckRace)) == "Duck Race");
  REQUIRE(std::string(user_message(DrawError::NoTasksAvailable)) == "Add tasks for paired mode.");
}
