#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include "commands.hpp"
#include "phasor.hpp"

namespace phasorplot
{
namespace ast
{
struct magnitude_arg final
{
  double value;
};

struct angle_arg final
{
  double value;
};

struct to_arg final
{
  point value;
};

struct at_arg final
{
  point value;
};

struct from_arg final
{
  std::string name;
  endpoint ref_point;
};

struct kind_arg final
{
  std::string value;
};

struct color_arg final
{
  std::string value;
};

struct phasor_command final
{
  std::string name;
  std::optional<double> magnitude;
  std::optional<double> angle_deg;
  std::optional<point> to;
  std::optional<point> at;
  std::optional<from_arg> from;
  std::optional<std::string> kind;
  std::optional<std::string> color;
};

struct chain_command final
{
  std::optional<point> at;
  std::optional<std::string> kind;
  std::vector<std::string> links;
};

using command = std::variant<phasor_command, chain_command, show_command, list_command,
                             bounds_command, clear_command, set_command, unset_command,
                             quit_command>;
} // namespace ast

// Reports syntax errors on stderr and returns nullopt for them.
std::optional<ast::command> parse_command_ast(std::string_view line);
} // namespace phasorplot
