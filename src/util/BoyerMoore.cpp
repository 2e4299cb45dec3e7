#include "util/BoyerMoore.hpp"
#include "util/AsciiLower.hpp"

namespace tasktop::util {

BoyerMooreSearch::BoyerMooreSearch(std::string_view pattern)
    : pattern_(ascii_lower_copy(pattern)) {
  const int m = static_cast<int>(pattern_.size());
  for (int i = 0; i < ALPHABET_SIZE; ++i) bad_char_[i] = m;
  // Last pattern char keeps the full shift
  for (int i = 0; i < m - 1; ++i) {
    bad_char_[static_cast<unsigned char>(pattern_[i])] = m - 1 - i;
  }
}

int BoyerMooreSearch::search(std::string_view text) const {
  const int n = static_cast<int>(text.size());
  const int m = static_cast<int>(pattern_.size());
  if (m == 0) return 0;
  if (m > n) return -1;

  int i = 0;
  while (i <= n - m) {
    int j = m - 1;
    while (j >= 0 &&
           ascii_lower(static_cast<unsigned char>(text[i + j])) ==
           static_cast<unsigned char>(pattern_[j])) {
      --j;
    }
    if (j < 0) return i;
    unsigned char bad = ascii_lower(static_cast<unsigned char>(text[i + m - 1]));
    int shift = bad_char_[bad];
    i += (shift > 0) ? shift : 1;
  }
  return -1;
}

} // namespace tasktop::util
