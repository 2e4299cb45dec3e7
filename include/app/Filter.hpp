#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "model/Process.hpp"
#include "util/BoyerMoore.hpp"

namespace tasktop::app {

// Strip surrounding whitespace; a blank query disables filtering.
[[nodiscard]] std::string trim_query(std::string_view q);

// Case-insensitive substring match on the process name.
class ProcessFilter {
public:
  explicit ProcessFilter(std::string_view query);
  [[nodiscard]] bool active() const { return !search_.empty(); }
  [[nodiscard]] bool matches(const tasktop::model::ProcessRecord& p) const;
  // Matching records, order preserved
  [[nodiscard]] std::vector<tasktop::model::ProcessRecord> apply(
      const std::vector<tasktop::model::ProcessRecord>& in) const;
private:
  tasktop::util::BoyerMooreSearch search_;
};

} // namespace tasktop::app
