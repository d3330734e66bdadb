#pragma once

#include <string>
#include <string_view>

namespace phasorplot
{
std::string to_lower(std::string_view s);
std::string_view trim(std::string_view s);
} // namespace phasorplot
