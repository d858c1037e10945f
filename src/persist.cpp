#include <edudraw/persist.hpp>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <istream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace edudraw {

using nlohmann::json;

namespace {

json history_to_json(const HistoryEntry& h) {
  json e;
  e["id"] = h.id;
  e["result"] = h.result;
  e["mode"] = to_string(h.mode);
  e["timestamp"] = h.timestamp;
  if (h.groups) e["groups"] = *h.groups;
  return e;
}

// Non-integral or negative entries are dropped; out-of-range ones are left
// for the lazy filter in draw_from_pool.
IndexPool pool_from_json(const json& arr) {
  IndexPool out;
  if (!arr.is_array()) return out;
  for (const auto& v : arr) {
    if (v.is_number_unsigned()) out.push_back(v.get<std::size_t>());
    else if (v.is_number_integer() && v.get<std::int64_t>() >= 0) out.push_back(static_cast<std::size_t>(v.get<std::int64_t>()));
  }
  return out;
}

HistoryLog history_from_json(const json& arr) {
  HistoryLog out;
  if (!arr.is_array()) return out;
  for (const auto& e : arr) {
    if (out.size() >= kMaxHistory) break;
    if (!e.is_object()) continue;
    HistoryEntry h;
    h.id = e.value("id", std::int64_t{0});
    h.result = e.value("result", std::string{});
    h.mode = draw_mode_from_string(e.value("mode", std::string{"single"})).value_or(DrawMode::Single);
    h.timestamp = e.value("timestamp", std::string{});
    if (e.contains("groups") && e.at("groups").is_array()) {
      h.groups = e.at("groups").get<std::vector<Group>>();
    }
    out.push_back(std::move(h));
  }
  return out;
}

} // namespace

std::filesystem::path default_state_dir() {
  const char* home = std::getenv("HOME");
  std::filesystem::path base = home ? (std::filesystem::path(home) / ".config") : std::filesystem::current_path();
  return base / "edudraw";
}

std::filesystem::path state_file_path(const std::filesystem::path& dir) {
  return dir / (std::string(kStorageKey) + ".json");
}

std::string state_to_json(const AppState& s) {
  json j;
  j["version"] = s.version;
  j["names"] = s.names;
  j["tasks"] = s.tasks;
  j["isNameNoRepeat"] = s.name_no_repeat;
  j["availableNamesIndices"] = s.name_pool;
  j["isTaskNoRepeat"] = s.task_no_repeat;
  j["availableTasksIndices"] = s.task_pool;
  j["mode"] = to_string(s.mode);
  j["interactiveMode"] = to_string(s.visual);
  j["numGroups"] = s.num_groups;

  json hist = json::array();
  const std::size_t n = std::min(s.history.size(), kMaxHistory);
  for (std::size_t i = 0; i < n; ++i) hist.push_back(history_to_json(s.history[i]));
  j["history"] = std::move(hist);
  return j.dump(2);
}

std::optional<AppState> state_from_json_stream(std::istream& in, const AppState& defaults) {
  const json j = json::parse(in, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object()) {
    spdlog::warn("saved state is not a JSON object; ignoring it");
    return std::nullopt;
  }

  AppState s = defaults;
  try {
    if (j.contains("version"))  s.version = j.at("version").get<std::uint64_t>();
    if (j.contains("names"))    s.names = j.at("names").get<std::vector<std::string>>();
    if (j.contains("tasks"))    s.tasks = j.at("tasks").get<std::vector<std::string>>();
    if (j.contains("isNameNoRepeat")) s.name_no_repeat = j.at("isNameNoRepeat").get<bool>();
    if (j.contains("isTaskNoRepeat")) s.task_no_repeat = j.at("isTaskNoRepeat").get<bool>();
    if (j.contains("availableNamesIndices")) s.name_pool = pool_from_json(j.at("availableNamesIndices"));
    if (j.contains("availableTasksIndices")) s.task_pool = pool_from_json(j.at("availableTasksIndices"));
    if (j.contains("mode")) {
      s.mode = draw_mode_from_string(j.at("mode").get<std::string>()).value_or(defaults.mode);
    }
    if (j.contains("interactiveMode")) {
      s.visual = visual_from_string(j.at("interactiveMode").get<std::string>()).value_or(defaults.visual);
    }
    if (j.contains("numGroups")) s.num_groups = std::max(1, j.at("numGroups").get<int>());
    if (j.contains("history"))   s.history = history_from_json(j.at("history"));
  } catch (const json::exception& e) {
    spdlog::warn("saved state is corrupt ({}); ignoring it", e.what());
    return std::nullopt;
  }
  return s;
}

std::optional<AppState> load_state(const std::filesystem::path& file, const AppState& defaults) {
  std::error_code ec;
  if (!std::filesystem::exists(file, ec)) {
    spdlog::debug("no saved state at {}", file.string());
    return std::nullopt;
  }
  std::ifstream in(file, std::ios::binary);
  if (!in.is_open()) {
    spdlog::warn("failed to open saved state {}", file.string());
    return std::nullopt;
  }
  auto s = state_from_json_stream(in, defaults);
  if (s) spdlog::info("loaded state from {} ({} names, {} history)", file.string(), s->names.size(), s->history.size());
  return s;
}

bool save_state(const std::filesystem::path& file, const AppState& s) {
  std::error_code ec;
  if (file.has_parent_path()) std::filesystem::create_directories(file.parent_path(), ec);
  if (ec) {
    spdlog::error("failed to save state: cannot create {}: {}", file.parent_path().string(), ec.message());
    return false;
  }
  std::ofstream out(file, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    spdlog::error("failed to save state: cannot open {}", file.string());
    return false;
  }
  out << state_to_json(s) << '\n';
  out.flush();
  if (!out) {
    spdlog::error("failed to save state: write to {} failed", file.string());
    return false;
  }
  return true;
}

} // namespace edudraw
