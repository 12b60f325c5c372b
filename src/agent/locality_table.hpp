#pragma once

#include <map>
#include <string>
#include <string_view>

namespace netdiag::agent {

// Label reported when no prefix matches an agreement identifier.
inline constexpr std::string_view kUndefinedLocality = "Undefined";

// Read-only mapping from agreement-number prefix to locality label. Built once
// at startup and handed to whoever needs it; nothing mutates it afterwards.
class LocalityTable {
public:
  LocalityTable() = default;
  explicit LocalityTable(std::map<std::string, std::string> prefix_to_locality);

  // Longest matching prefix wins ("481" beats "48"). Returns
  // kUndefinedLocality when nothing matches.
  std::string Lookup(std::string_view agreement_id) const;

  std::size_t size() const {
    return prefix_to_locality_.size();
  }

  // Agreement prefixes of the operator's branch network.
  static const LocalityTable& Default();

private:
  std::map<std::string, std::string> prefix_to_locality_;
};

} // namespace netdiag::agent
