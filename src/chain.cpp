#include "chain.hpp"
#include <charconv>
#include <ctre.hpp>
#include <fmt/format.h>
#include "strings.hpp"

namespace
{
std::optional<double> parse_number(std::string_view s)
{
  s = phasorplot::trim(s);
  if (!s.empty() && s.front() == '+')
  {
    s.remove_prefix(1);
  }
  double x = 0.0;
  auto [ptr, errc] = std::from_chars(s.data(), s.data() + s.size(), x);
  if (s.empty() || errc != std::errc() || ptr != s.data() + s.size())
  {
    return std::nullopt;
  }
  return x;
}
} // namespace

namespace phasorplot
{
std::expected<chain_link, std::string> parse_chain_link(std::string_view text)
{
  static constexpr char re[] = "([^,]*),([^,]*),([^,]*)";
  auto [whole, label_str, magnitude_str, angle_str] = ctre::match<re>(text);
  if (!whole)
  {
    return std::unexpected(fmt::format(
        "invalid vector '{}': expected exactly 3 comma-separated values label,magnitude,angle",
        text));
  }

  const auto label = trim(label_str.to_view());
  if (label.empty())
  {
    return std::unexpected(fmt::format("invalid vector '{}': empty label", text));
  }
  const auto magnitude = parse_number(magnitude_str.to_view());
  if (!magnitude)
  {
    return std::unexpected(fmt::format("invalid vector '{}': magnitude '{}' is not a number",
                                       text, trim(magnitude_str.to_view())));
  }
  const auto angle = parse_number(angle_str.to_view());
  if (!angle)
  {
    return std::unexpected(fmt::format("invalid vector '{}': angle '{}' is not a number", text,
                                       trim(angle_str.to_view())));
  }
  return chain_link{.label = std::string(label), .magnitude = *magnitude, .angle_deg = *angle};
}

std::expected<std::vector<phasor>, registry_error> add_chain(phasor_registry &registry,
                                                             const point &origin,
                                                             std::span<const chain_link> links,
                                                             const phasor_style &style)
{
  auto staged = registry;
  auto added = std::vector<phasor>();
  added.reserve(links.size());
  for (const auto &link : links)
  {
    auto anchor = added.empty() ? phasor_anchor(absolute{.x = origin.x, .y = origin.y})
                                : phasor_anchor(relative_to{.name = added.back().name,
                                                            .ref_point = endpoint::end});
    auto p = staged.add(link.label,
                        geometry_spec{.shape = polar{.magnitude = link.magnitude,
                                                     .angle_deg = link.angle_deg},
                                      .anchor = std::move(anchor)},
                        style);
    if (!p)
    {
      return std::unexpected(std::move(p.error()));
    }
    added.push_back(std::move(*p));
  }
  registry = std::move(staged);
  return added;
}
} // namespace phasorplot
