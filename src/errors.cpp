#include "errors.hpp"

namespace phasorplot
{
std::string_view to_string(error_code code)
{
  switch (code)
  {
  case error_code::unknown_reference:
    return "unknown reference";
  case error_code::missing_geometry:
    return "missing geometry";
  case error_code::duplicate_name:
    return "duplicate name";
  case error_code::invalid_name:
    return "invalid name";
  case error_code::invalid_geometry:
    return "invalid geometry";
  case error_code::conflicting_anchor:
    return "conflicting anchor";
  }
  return "";
}
} // namespace phasorplot
