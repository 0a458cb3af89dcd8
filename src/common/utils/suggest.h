#ifndef AGENTFLOW_COMMON_UTILS_SUGGEST_H
#define AGENTFLOW_COMMON_UTILS_SUGGEST_H

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentflow {

size_t edit_distance(std::string_view a, std::string_view b);

// Closest candidate within max_distance edits (ties: first in candidate order).
std::optional<std::string> closest_match(std::string_view name,
                                         const std::vector<std::string>& candidates,
                                         size_t max_distance = 2);

// "Did you mean 'x'?" or "" when nothing is close enough.
std::string did_you_mean(std::string_view name, const std::vector<std::string>& candidates);

} // namespace agentflow

#endif // AGENTFLOW_COMMON_UTILS_SUGGEST_H
