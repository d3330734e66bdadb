#pragma once

#include <string>
#include <string_view>

namespace phasorplot
{
enum class error_code
{
  unknown_reference,
  missing_geometry,
  duplicate_name,
  invalid_name,
  invalid_geometry,
  conflicting_anchor
};

struct registry_error final
{
  error_code code;
  std::string message;
};

std::string_view to_string(error_code code);
} // namespace phasorplot
