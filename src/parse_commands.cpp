#include "parse_commands.hpp"
#include <cmath>
#include <fmt/format.h>
#include <ranges>
#include <utility>
#include "colors.hpp"
#include "parse_ast.hpp"
#include "strings.hpp"

namespace
{
using namespace phasorplot;

auto validate_all(std::ranges::range auto r)
{
  using exp = std::ranges::range_value_t<decltype(r)>;
  using value = exp::value_type;
  using error = exp::error_type;
  auto result = std::expected<std::vector<value>, error>();
  for (auto &&e : r)
  {
    if (e.has_value())
    {
      result.value().push_back(std::move(e.value()));
    }
    else
    {
      result = std::unexpected(std::move(e.error()));
      break;
    }
  }
  return result;
}

std::expected<std::optional<glm::vec4>, std::string>
validate_color(const std::optional<std::string> &text)
{
  if (!text)
  {
    return std::nullopt;
  }
  if (auto c = parse_color(*text); c)
  {
    return c;
  }
  return std::unexpected(fmt::format("unknown color '{}'", *text));
}

std::expected<void, std::string> validate_setting(const any_settings_value &value)
{
  struct validator
  {
    std::expected<void, std::string>
    operator()(const settings_value<settings_id::label_offset> &v) const
    {
      if (!std::isfinite(v.value))
      {
        return std::unexpected("labeloffset must be finite");
      }
      return {};
    }
    std::expected<void, std::string> operator()(const settings_value<settings_id::margin> &v) const
    {
      if (!std::isfinite(v.value) || v.value < 0.0)
      {
        return std::unexpected(fmt::format("margin must not be negative, got {}", v.value));
      }
      return {};
    }
    std::expected<void, std::string>
    operator()(const settings_value<settings_id::min_margin> &v) const
    {
      if (!std::isfinite(v.value) || v.value < 0.0)
      {
        return std::unexpected(fmt::format("minmargin must not be negative, got {}", v.value));
      }
      return {};
    }
    std::expected<void, std::string>
    operator()(const settings_value<settings_id::precision> &v) const
    {
      if (v.value > 12)
      {
        return std::unexpected(fmt::format("precision must be at most 12, got {}", v.value));
      }
      return {};
    }
    std::expected<void, std::string> operator()(const auto &) const { return {}; }
  };
  return std::visit(validator{}, value);
}

struct command_validator
{
  std::expected<command, std::string> operator()(ast::phasor_command &&cmd) const
  {
    return validate_color(cmd.color).transform(
        [&](std::optional<glm::vec4> &&color) -> command
        {
          auto request = draw_request{.name = std::move(cmd.name),
                                      .magnitude = cmd.magnitude,
                                      .angle_deg = cmd.angle_deg,
                                      .start = cmd.at,
                                      .kind = std::move(cmd.kind),
                                      .color = color};
          if (cmd.to)
          {
            request.end_x = cmd.to->x;
            request.end_y = cmd.to->y;
          }
          if (cmd.from)
          {
            request.from =
                relative_to{.name = std::move(cmd.from->name), .ref_point = cmd.from->ref_point};
          }
          return phasor_command{std::move(request)};
        });
  }

  std::expected<command, std::string> operator()(ast::chain_command &&cmd) const
  {
    return validate_all(cmd.links
                        | std::views::transform([](const std::string &link)
                                                { return parse_chain_link(link); }))
        .transform(
            [&](std::vector<chain_link> &&links) -> command
            {
              return chain_command{.origin = cmd.at.value_or(point(0.0, 0.0)),
                                   .kind = std::move(cmd.kind),
                                   .links = std::move(links)};
            });
  }

  std::expected<command, std::string> operator()(set_command &&cmd) const
  {
    return validate_setting(cmd.value).transform([&]() -> command { return std::move(cmd); });
  }

  template <typename passthrough>
  std::expected<command, std::string> operator()(passthrough &&cmd) const
  {
    return std::move(cmd);
  }
};
} // namespace

namespace phasorplot
{
std::expected<command, std::string> parse_command(std::string_view line)
{
  if (auto ast = parse_command_ast(trim(line)); ast)
  {
    return std::visit(command_validator{}, std::move(*ast));
  }
  else
  {
    return std::unexpected("unknown command");
  }
}
} // namespace phasorplot
