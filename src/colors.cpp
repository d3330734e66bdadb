#include "colors.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <fmt/format.h>
#include <utility>
#include "strings.hpp"

namespace
{
using namespace std::string_view_literals;
using namespace phasorplot;
static constexpr std::pair<std::string_view, glm::vec4> named_colors[] = {
    {"blue"sv, from_rgb(0x0000ff)},       {"red"sv, from_rgb(0xff0000)},
    {"green"sv, from_rgb(0x008000)},      {"black"sv, from_rgb(0x000000)},
    {"white"sv, from_rgb(0xffffff)},      {"grey"sv, from_rgb(0x7f7f7f)},
    {"gray"sv, from_rgb(0x7f7f7f)},       {"cyan"sv, from_rgb(0x00ffff)},
    {"magenta"sv, from_rgb(0xff00ff)},    {"yellow"sv, from_rgb(0xffff00)},
    {"purple"sv, from_rgb(0x800080)},     {"orange"sv, from_rgb(0xffa500)},
    {"brown"sv, from_rgb(0xa52a2a)},      {"pink"sv, from_rgb(0xffc0cb)},
    {"olive"sv, from_rgb(0x808000)},      {"navy"sv, from_rgb(0x000080)},
    {"teal"sv, from_rgb(0x008080)},       {"gold"sv, from_rgb(0xffd700)},
    {"darkred"sv, from_rgb(0x8b0000)},    {"darkgreen"sv, from_rgb(0x006400)},
    {"darkblue"sv, from_rgb(0x00008b)},   {"royalblue"sv, from_rgb(0x4169e1)},
    {"steelblue"sv, from_rgb(0x4682b4)},  {"skyblue"sv, from_rgb(0x87ceeb)},
    {"violet"sv, from_rgb(0xee82ee)},     {"coral"sv, from_rgb(0xff7f50)},
    {"salmon"sv, from_rgb(0xfa8072)},     {"khaki"sv, from_rgb(0xf0e68c)},
    {"turquoise"sv, from_rgb(0x40e0d0)},  {"orchid"sv, from_rgb(0xda70d6)},
    {"crimson"sv, from_rgb(0xdc143c)},    {"indigo"sv, from_rgb(0x4b0082)}};

int channel(float c) { return static_cast<int>(std::lround(std::clamp(c, 0.0f, 1.0f) * 255.0f)); }
} // namespace

namespace phasorplot
{
glm::vec4 default_color(std::string_view kind)
{
  const auto k = to_lower(kind);
  if (k == "voltage")
  {
    return voltage_color;
  }
  else if (k == "current")
  {
    return current_color;
  }
  return neutral_color;
}

std::optional<glm::vec4> get_named_color(std::string_view name)
{
  const auto n = to_lower(name);
  for (const auto &c : named_colors)
  {
    if (n == c.first)
    {
      return c.second;
    }
  }
  return std::nullopt;
}

std::optional<std::string_view> color_name(const glm::vec4 &color)
{
  for (const auto &c : named_colors)
  {
    if (c.second == color)
    {
      return c.first;
    }
  }
  return std::nullopt;
}

std::optional<glm::vec4> parse_color(std::string_view text)
{
  if (text.size() == 7 && text.front() == '#')
  {
    unsigned int rgb = 0;
    auto [ptr, errc] = std::from_chars(text.data() + 1, text.data() + text.size(), rgb, 16);
    if (errc != std::errc() || ptr != text.data() + text.size())
    {
      return std::nullopt;
    }
    return from_rgb(static_cast<int>(rgb));
  }
  return get_named_color(text);
}

std::string format_color(const glm::vec4 &color)
{
  return fmt::format("#{:02x}{:02x}{:02x}", channel(color.r), channel(color.g), channel(color.b));
}
} // namespace phasorplot
