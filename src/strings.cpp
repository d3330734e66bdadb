#include "strings.hpp"
#include <algorithm>
#include <cctype>

namespace phasorplot
{
std::string to_lower(std::string_view s)
{
  auto result = std::string(s);
  std::ranges::transform(result, result.begin(),
                         [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return result;
}

std::string_view trim(std::string_view s)
{
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
  {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
  {
    s.remove_suffix(1);
  }
  return s;
}
} // namespace phasorplot
