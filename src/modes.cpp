#include <edudraw/modes.hpp>

namespace edudraw {

const char* to_string(DrawMode m) {
  switch (m) {
    case DrawMode::Single:      return "single";
    case DrawMode::Paired:      return "paired";
    case DrawMode::Groups:      return "groups";
    case DrawMode::Interactive: return "interactive";
    default: return "single";
  }
}

const char* to_string(VisualKind v) {
  switch (v) {
    case VisualKind::Wheel:      return "wheel";
    case VisualKind::DuckRace:   return "race";
    case VisualKind::MarbleRace: return "marble";
    case VisualKind::Card:       return "card";
    default: return "wheel";
  }
}

std::optional<DrawMode> draw_mode_from_string(std::string_view s) {
  if (s == "single")      return DrawMode::Single;
  if (s == "paired")      return DrawMode::Paired;
  if (s == "groups")      return DrawMode::Groups;
  if (s == "interactive") return DrawMode::Interactive;
  return std::nullopt;
}

std::optional<VisualKind> visual_from_string(std::string_view s) {
  if (s == "wheel")  return VisualKind::Wheel;
  if (s == "race")   return VisualKind::DuckRace;
  if (s == "marble") return VisualKind::MarbleRace;
  if (s == "card")   return VisualKind::Card;
  return std::nullopt;
}

const char* display_name(DrawMode m) {
  switch (m) {
    case DrawMode::Single:      return "Single";
    case DrawMode::Paired:      return "Paired";
    case DrawMode::Groups:      return "Groups";
    case DrawMode::Interactive: return "Interactive";
    default: return "Unknown";
  }
}

const char* display_name(VisualKind v) {
  switch (v) {
    case VisualKind::Wheel:      return "Wheel";
    case VisualKind::DuckRace:   return "Duck Race";
    case VisualKind::MarbleRace: return "Marble Race";
    case VisualKind::Card:       return "Lucky Card";
    default: return "Unknown";
  }
}

} // namespace edudraw
