#include <edudraw/history.hpp>
#include <algorithm>
#include <chrono>
#include <ctime>
#include <sstream>

namespace edudraw {

static std::string local_time_hhmmss_() {
  std::time_t t = std::time(nullptr);
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  char buf[16];
  std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
  return std::string(buf);
}

HistoryLog append_history(const HistoryLog& log, HistoryEntry entry) {
  HistoryLog out;
  out.reserve(std::min(log.size() + 1, kMaxHistory));
  out.push_back(std::move(entry));
  for (const auto& e : log) {
    if (out.size() >= kMaxHistory) break;
    out.push_back(e);
  }
  return out;
}

HistoryEntry make_history_entry(std::string result,
                                DrawMode mode,
                                const HistoryLog& log,
                                std::optional<std::vector<Group>> groups) {
  using namespace std::chrono;
  std::int64_t id = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
  if (!log.empty() && id <= log.front().id) id = log.front().id + 1;

  HistoryEntry e;
  e.id = id;
  e.result = std::move(result);
  e.mode = mode;
  e.timestamp = local_time_hhmmss_();
  e.groups = std::move(groups);
  return e;
}

std::string format_history(const HistoryLog& log) {
  std::ostringstream os;
  for (std::size_t i = 0; i < log.size(); ++i) {
    const auto& h = log[i];
    if (i > 0) os << '\n';
    os << (i + 1) << ". [" << h.timestamp << "] (" << to_string(h.mode) << "): " << h.result;
  }
  return os.str();
}

} // namespace edudraw
