#include <edudraw/groups.hpp>
#include <sstream>
#include <edudraw/random.hpp>

namespace edudraw {

std::optional<std::vector<Group>> partition_groups(const std::vector<std::string>& list,
                                                   int num_groups,
                                                   std::mt19937& rng,
                                                   DrawError* why) {
  if (num_groups < 1) {
    if (why) *why = DrawError::InvalidGroupCount;
    return std::nullopt;
  }
  const auto k = static_cast<std::size_t>(num_groups);
  if (list.size() < k) {
    if (why) *why = DrawError::InsufficientItems;
    return std::nullopt;
  }

  std::vector<std::string> shuffled = list;
  fisher_yates(shuffled, rng);

  std::vector<Group> groups(k);
  for (auto& g : groups) g.reserve(shuffled.size() / k + 1);
  for (std::size_t i = 0; i < shuffled.size(); ++i) {
    groups[i % k].push_back(std::move(shuffled[i]));
  }
  if (why) *why = DrawError::None;
  return groups;
}

std::string format_groups(const std::vector<Group>& groups) {
  std::ostringstream os;
  for (std::size_t g = 0; g < groups.size(); ++g) {
    if (g > 0) os << " | ";
    os << "Group " << (g + 1) << ": ";
    for (std::size_t i = 0; i < groups[g].size(); ++i) {
      if (i > 0) os << ", ";
      os << groups[g][i];
    }
  }
  return os.str();
}

} // namespace edudraw
