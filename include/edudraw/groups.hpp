#pragma once
#include <optional>
#include <random>
#include <string>
#include <vector>
#include <edudraw/draw_error.hpp>

namespace edudraw {

using Group = std::vector<std::string>;

// Shuffle a copy of `list` (Fisher-Yates) and deal it round-robin into
// num_groups groups; sizes differ by at most one.
// Fails with InvalidGroupCount (num_groups < 1) or InsufficientItems
// (fewer items than groups).
std::optional<std::vector<Group>> partition_groups(const std::vector<std::string>& list,
                                                   int num_groups,
                                                   std::mt19937& rng,
                                                   DrawError* why = nullptr);

// "Group 1: a, b | Group 2: c"
std::string format_groups(const std::vector<Group>& groups);

} // namespace edudraw
