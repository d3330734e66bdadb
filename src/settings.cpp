#include "settings.hpp"
#include <fmt/format.h>
#include <type_traits>
#include "commands.hpp"

namespace
{
using namespace phasorplot;

template <typename Value>
std::string to_string_(const Value &value)
{
  return fmt::format("{}", value);
}

template <>
std::string to_string_(const duplicate_policy &policy)
{
  switch (policy)
  {
  case duplicate_policy::reject:
    return "reject";
  case duplicate_policy::overwrite:
    return "overwrite";
  }
  return "";
}

template <settings_id id>
settings_type_t<id> default_value()
{
  return {};
}

template <>
duplicate_policy default_value<settings_id::duplicates>()
{
  return duplicate_policy::reject;
}

template <>
std::string default_value<settings_id::kind>()
{
  return "voltage";
}

template <>
double default_value<settings_id::label_offset>()
{
  return 0.1;
}

template <>
double default_value<settings_id::margin>()
{
  return 0.1;
}

template <>
double default_value<settings_id::min_margin>()
{
  return 1.0;
}

template <>
int default_value<settings_id::precision>()
{
  return 2;
}

template <settings_id id>
settings_type_t<id> place = default_value<id>();

} // namespace

namespace phasorplot
{
namespace settings
{
std::string show(const any_setting &setting)
{
  return std::visit([](auto s) { return to_string_(place<decltype(s)::id>); }, setting);
}

void set(const any_settings_value &value)
{
  std::visit([](const auto &v) { place<std::remove_cvref_t<decltype(v)>::id> = v.value; },
             value);
}

void unset(const any_setting &setting)
{
  std::visit([](auto s) { place<decltype(s)::id> = default_value<decltype(s)::id>(); }, setting);
}

duplicate_policy duplicates() { return place<settings_id::duplicates>; }
const std::string &kind() { return place<settings_id::kind>; }
double label_offset() { return place<settings_id::label_offset>; }
double margin() { return place<settings_id::margin>; }
double min_margin() { return place<settings_id::min_margin>; }
int precision() { return place<settings_id::precision>; }
} // namespace settings
} // namespace phasorplot
