#include <edudraw/app_state.hpp>

namespace edudraw {

AppState default_app_state() {
  AppState s;
  s.names = {"John", "Jane", "Alice", "Bob", "Charlie", "Diana"};
  s.name_pool = full_pool(s.names.size());
  s.mode = DrawMode::Single;
  s.visual = VisualKind::Wheel;
  s.num_groups = 2;
  return s;
}

} // namespace edudraw
