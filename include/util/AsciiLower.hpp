#pragma once
#include <array>
#include <string>
#include <string_view>

namespace tasktop::util {

namespace detail {
constexpr std::array<unsigned char, 256> make_lower_table() {
  std::array<unsigned char, 256> t{};
  for (int i = 0; i < 256; ++i) {
    t[i] = static_cast<unsigned char>((i >= 'A' && i <= 'Z') ? i + ('a' - 'A') : i);
  }
  return t;
}
inline constexpr auto kLowerTable = make_lower_table();
} // namespace detail

[[nodiscard]] constexpr unsigned char ascii_lower(unsigned char c) noexcept {
  return detail::kLowerTable[c];
}

[[nodiscard]] inline std::string ascii_lower_copy(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(ascii_lower(static_cast<unsigned char>(c)));
  return out;
}

} // namespace tasktop::util
