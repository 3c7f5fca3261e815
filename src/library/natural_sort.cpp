#include "natural_sort.hpp"

#include <algorithm>
#include <cctype>

namespace cue {

namespace {

bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

char fold(char c) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

} // namespace

int natural_compare(const std::string &a, const std::string &b) {
  size_t i = 0, j = 0;
  while (i < a.size() && j < b.size()) {
    if (is_digit(a[i]) && is_digit(b[j])) {
      size_t start_a = i, start_b = j;
      while (i < a.size() && is_digit(a[i])) ++i;
      while (j < b.size() && is_digit(b[j])) ++j;

      size_t sig_a = start_a, sig_b = start_b;
      while (sig_a + 1 < i && a[sig_a] == '0') ++sig_a;
      while (sig_b + 1 < j && b[sig_b] == '0') ++sig_b;

      size_t len_a = i - sig_a, len_b = j - sig_b;
      if (len_a != len_b) {
        return len_a < len_b ? -1 : 1;
      }
      int digits = a.compare(sig_a, len_a, b, sig_b, len_b);
      if (digits != 0) {
        return digits < 0 ? -1 : 1;
      }
      continue;
    }

    char ca = fold(a[i]), cb = fold(b[j]);
    if (ca != cb) {
      return ca < cb ? -1 : 1;
    }
    ++i;
    ++j;
  }

  if (i < a.size()) return 1;
  if (j < b.size()) return -1;

  // Equal under the natural order ("ep01" vs "ep1", "A" vs "a").
  int raw = a.compare(b);
  return raw < 0 ? -1 : (raw > 0 ? 1 : 0);
}

void natural_sort(std::vector<std::string> &items) {
  std::stable_sort(items.begin(), items.end(), natural_less);
}

} // namespace cue
