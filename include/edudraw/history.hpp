#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <edudraw/groups.hpp>
#include <edudraw/modes.hpp>

namespace edudraw {

inline constexpr std::size_t kMaxHistory = 50;

struct HistoryEntry {
  std::int64_t id = 0;       // monotonic (epoch ms at creation)
  std::string result;        // display string
  DrawMode mode{DrawMode::Single};
  std::string timestamp;     // local display time, HH:MM:SS
  std::optional<std::vector<Group>> groups;
};

// Most recent first.
using HistoryLog = std::vector<HistoryEntry>;

// [entry, ...log] truncated to kMaxHistory. Pure.
HistoryLog append_history(const HistoryLog& log, HistoryEntry entry);

// Build an entry stamped with the wall clock. The id is forced above the
// newest id in `log` so ids stay strictly increasing.
HistoryEntry make_history_entry(std::string result,
                                DrawMode mode,
                                const HistoryLog& log,
                                std::optional<std::vector<Group>> groups = std::nullopt);

// "1. [10:42:07] (single): Alice" one line per entry, for the clipboard.
std::string format_history(const HistoryLog& log);

} // namespace edudraw
