#include "report.hpp"
#include <cmath>
#include <fmt/format.h>
#include "colors.hpp"

namespace
{
using namespace phasorplot;

// Rounds to what gets printed, so that values which round to zero never print as "-0".
double displayed(double value, int precision)
{
  const auto scale = std::pow(10.0, precision);
  if (!std::isfinite(value * scale))
  {
    return value;
  }
  const auto rounded = std::round(value * scale) / scale;
  return rounded == 0.0 ? 0.0 : rounded;
}

// Keeps the printed angle in (-180, 180] after rounding.
double displayed_angle(double angle_deg, int precision)
{
  const auto a = displayed(angle_deg, precision);
  return a <= -180.0 ? a + 360.0 : a;
}

std::string format_point(const point &p, int precision)
{
  return fmt::format("({:.{}f}, {:.{}f})", displayed(p.x, precision), precision,
                     displayed(p.y, precision), precision);
}

std::string format_color_label(const glm::vec4 &color)
{
  if (auto name = color_name(color); name)
  {
    return std::string(*name);
  }
  return format_color(color);
}
} // namespace

namespace phasorplot
{
std::string describe(const phasor &p, int precision)
{
  return fmt::format("{} [{}]: start {}, end {}, magnitude {:.{}f}, angle {:.{}f} deg, color {}",
                     p.name, p.kind, format_point(p.start, precision),
                     format_point(p.end, precision), displayed(p.magnitude, precision), precision,
                     displayed_angle(p.angle_deg, precision), precision,
                     format_color_label(p.color));
}

std::string describe(const arrow &a, int precision)
{
  return fmt::format("{}: {} -> {}, label at {}, {}", a.label, format_point(a.start, precision),
                     format_point(a.end, precision), format_point(a.label_anchor, precision),
                     format_color(a.color));
}

std::string describe(const rect &r, int precision)
{
  return fmt::format("x [{:.{}f}, {:.{}f}], y [{:.{}f}, {:.{}f}]",
                     displayed(r.lower_bounds.x, precision), precision,
                     displayed(r.upper_bounds.x, precision), precision,
                     displayed(r.lower_bounds.y, precision), precision,
                     displayed(r.upper_bounds.y, precision), precision);
}
} // namespace phasorplot
