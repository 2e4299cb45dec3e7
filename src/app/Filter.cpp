#include "app/Filter.hpp"
#include <cctype>

namespace tasktop::app {

std::string trim_query(std::string_view q) {
  while (!q.empty() && std::isspace(static_cast<unsigned char>(q.front()))) q.remove_prefix(1);
  while (!q.empty() && std::isspace(static_cast<unsigned char>(q.back()))) q.remove_suffix(1);
  return std::string(q);
}

ProcessFilter::ProcessFilter(std::string_view query) : search_(trim_query(query)) {}

bool ProcessFilter::matches(const tasktop::model::ProcessRecord& p) const {
  return search_.contains(p.name);
}

std::vector<tasktop::model::ProcessRecord> ProcessFilter::apply(
    const std::vector<tasktop::model::ProcessRecord>& in) const {
  if (!active()) return in;
  std::vector<tasktop::model::ProcessRecord> out;
  out.reserve(in.size());
  for (const auto& p : in) if (matches(p)) out.push_back(p);
  return out;
}

} // namespace tasktop::app
