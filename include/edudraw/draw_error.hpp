#pragma once

namespace edudraw {

// Recoverable reasons a draw was not performed.
enum class DrawError : int {
  None = 0,
  EmptyList,            // no participants to draw from
  PoolExhausted,        // no-repeat pool empty; pool has been reset
  InvalidGroupCount,    // fewer than one group requested
  InsufficientItems,    // more groups than names
  NoTasksAvailable,     // paired mode with an empty task list
  NotEnoughNames,       // interactive mode needs two names
  SessionAlreadyActive, // an animation is still running
  AnimationFailed       // the visualization refused or failed to start
};

const char* to_string(DrawError e);

// Short notice suitable for a toast.
const char* user_message(DrawError e);

} // namespace edudraw
