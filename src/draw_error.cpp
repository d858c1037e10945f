#include <edudraw/draw_error.hpp>

namespace edudraw {

const char* to_string(DrawError e) {
  switch (e) {
    case DrawError::None:                 return "None";
    case DrawError::EmptyList:            return "EmptyList";
    case DrawError::PoolExhausted:        return "PoolExhausted";
    case DrawError::InvalidGroupCount:    return "InvalidGroupCount";
    case DrawError::InsufficientItems:    return "InsufficientItems";
    case DrawError::NoTasksAvailable:     return "NoTasksAvailable";
    case DrawError::NotEnoughNames:       return "NotEnoughNames";
    case DrawError::SessionAlreadyActive: return "SessionAlreadyActive";
    case DrawError::AnimationFailed:      return "AnimationFailed";
  }
  return "Unknown";
}

const char* user_message(DrawError e) {
  switch (e) {
    case DrawError::None:                 return "";
    case DrawError::EmptyList:            return "Add names first.";
    case DrawError::PoolExhausted:        return "All names drawn! Resetting list.";
    case DrawError::InvalidGroupCount:    return "Invalid group number.";
    case DrawError::InsufficientItems:    return "Not enough names for that many groups.";
    case DrawError::NoTasksAvailable:     return "Add tasks for paired mode.";
    case DrawError::NotEnoughNames:       return "Need at least 2 names.";
    case DrawError::SessionAlreadyActive: return "A draw is already running.";
    case DrawError::AnimationFailed:      return "Could not start the animation.";
  }
  return "";
}

} // namespace edudraw
