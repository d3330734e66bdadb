#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "chain.hpp"
#include "geometry_spec.hpp"
#include "registry.hpp"

namespace phasorplot
{
template <typename E, E... es>
struct enum_sequence
{
};

template <typename E, template <E> typename F, typename Es>
struct enum_sum;

template <typename E, template <E> typename F, E... Es>
struct enum_sum<E, F, enum_sequence<E, Es...>>
{
  using type = std::variant<F<Es>...>;
};

template <typename E, template <E> typename F, typename Es>
using enum_sum_t = typename enum_sum<E, F, Es>::type;

enum class settings_id
{
  duplicates,
  kind,
  label_offset,
  margin,
  min_margin,
  precision
};

using all_settings =
    enum_sequence<settings_id, settings_id::duplicates, settings_id::kind,
                  settings_id::label_offset, settings_id::margin, settings_id::min_margin,
                  settings_id::precision>;

template <settings_id id>
struct settings_type;

template <>
struct settings_type<settings_id::duplicates>
{
  using type = duplicate_policy;
};

template <>
struct settings_type<settings_id::kind>
{
  using type = std::string;
};

template <>
struct settings_type<settings_id::label_offset>
{
  using type = double;
};

template <>
struct settings_type<settings_id::margin>
{
  using type = double;
};

template <>
struct settings_type<settings_id::min_margin>
{
  using type = double;
};

template <>
struct settings_type<settings_id::precision>
{
  using type = int;
};

template <settings_id id>
using settings_type_t = typename settings_type<id>::type;

template <settings_id id_>
struct setting_ref final
{
  static constexpr settings_id id = id_;
};

template <settings_id id_>
struct settings_value final
{
  static constexpr settings_id id = id_;
  settings_type_t<id_> value;
};

using any_setting = enum_sum_t<settings_id, setting_ref, all_settings>;
using any_settings_value = enum_sum_t<settings_id, settings_value, all_settings>;

struct quit_command final
{
};

struct phasor_command final
{
  draw_request request;
};

struct chain_command final
{
  point origin;
  std::optional<std::string> kind;
  std::vector<chain_link> links;
};

struct show_command final
{
  std::variant<std::string, any_setting> target;
};

struct list_command final
{
};

struct bounds_command final
{
};

struct clear_command final
{
};

struct set_command final
{
  any_settings_value value;
};

struct unset_command final
{
  any_setting setting;
};

using command = std::variant<quit_command, phasor_command, chain_command, show_command,
                             list_command, bounds_command, clear_command, set_command,
                             unset_command>;

inline bool is_quit_command(const command &cmd)
{
  return std::holds_alternative<quit_command>(cmd);
}
} // namespace phasorplot
