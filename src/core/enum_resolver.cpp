#include "msx/core/enum_resolver.hpp"

#include <algorithm>
#include <cctype>

namespace msx::core {

auto normalize_enum_name(std::string_view raw, std::string_view prefix) -> std::string {
  std::string name(raw);
  std::ranges::transform(name, name.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  const auto first = std::ranges::find_if_not(name, is_space);
  const auto last = std::find_if_not(name.rbegin(), name.rend(), is_space).base();
  name = (first < last) ? std::string(first, last) : std::string{};

  std::ranges::replace(name, '-', '_');
  std::ranges::replace(name, ' ', '_');

  if (!prefix.empty() && name.starts_with(prefix)) {
    name.erase(0, prefix.size());
  }
  return name;
}

} // namespace msx::core
