#pragma once
#include <optional>
#include <string_view>

namespace edudraw {

enum class DrawMode : int {
  Single = 0,
  Paired = 1,
  Groups = 2,
  Interactive = 3,
  Count
};

// Visualization used by DrawMode::Interactive.
enum class VisualKind : int {
  Wheel = 0,
  DuckRace = 1,
  MarbleRace = 2,
  Card = 3,
  Count
};

enum class ListKind { Names, Tasks };

// Stable lowercase keys ("single", "wheel", "race", ...) used in saved state.
const char* to_string(DrawMode m);
const char* to_string(VisualKind v);
std::optional<DrawMode>   draw_mode_from_string(std::string_view s);
std::optional<VisualKind> visual_from_string(std::string_view s);

// Human-facing labels.
const char* display_name(DrawMode m);
const char* display_name(VisualKind v);

} // namespace edudraw
