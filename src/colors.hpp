#pragma once

#include <glm/vec4.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace phasorplot
{
constexpr glm::vec4 from_rgb(int rgb)
{
  return {static_cast<float>((rgb >> 16) & 0xFF) / 255.0f,
          static_cast<float>((rgb >> 8) & 0xFF) / 255.0f, static_cast<float>(rgb & 0xFF) / 255.0f,
          1.0f};
}

inline constexpr glm::vec4 voltage_color = from_rgb(0x0000ff);
inline constexpr glm::vec4 current_color = from_rgb(0xff0000);
inline constexpr glm::vec4 neutral_color = from_rgb(0x7f7f7f);

// Color for a phasor kind that was given no explicit color. Kinds compare case-insensitively.
glm::vec4 default_color(std::string_view kind);

std::optional<glm::vec4> get_named_color(std::string_view name);
std::optional<std::string_view> color_name(const glm::vec4 &color);

// Accepts a color name or "#rrggbb".
std::optional<glm::vec4> parse_color(std::string_view text);

std::string format_color(const glm::vec4 &color);
} // namespace phasorplot
