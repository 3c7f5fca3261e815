#pragma once

#include <string>
#include <vector>

namespace cue {

// "ep2" < "ep10": digit runs compare by numeric value, everything else
// case-insensitively. Ties fall back to a plain byte comparison so the
// order is total and stable across runs.
int natural_compare(const std::string &a, const std::string &b);

inline bool natural_less(const std::string &a, const std::string &b) {
  return natural_compare(a, b) < 0;
}

void natural_sort(std::vector<std::string> &items);

} // namespace cue
