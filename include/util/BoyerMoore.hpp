#pragma once

#include <string>
#include <string_view>

namespace tasktop::util {

// Case-insensitive Boyer-Moore-Horspool literal search, used for the
// process name filter. The pattern is folded once; each search is
// sublinear on average.
class BoyerMooreSearch {
public:
  explicit BoyerMooreSearch(std::string_view pattern);

  // Position of the first match, or -1. An empty pattern matches at 0.
  [[nodiscard]] int search(std::string_view text) const;
  [[nodiscard]] bool contains(std::string_view text) const { return search(text) >= 0; }
  [[nodiscard]] bool empty() const { return pattern_.empty(); }

private:
  static constexpr int ALPHABET_SIZE = 256;

  int bad_char_[ALPHABET_SIZE]{};
  std::string pattern_; // lowercased
};

} // namespace tasktop::util
