#include "registry.hpp"
#include <cmath>
#include <fmt/format.h>
#include "colors.hpp"
#include "strings.hpp"

namespace
{
using namespace phasorplot;

std::unexpected<registry_error> invalid_geometry(std::string_view name, std::string_view what)
{
  return std::unexpected(registry_error{error_code::invalid_geometry,
                                        fmt::format("phasor '{}' has {}", name, what)});
}

std::expected<void, registry_error> validate(std::string_view name, const geometry_spec &g)
{
  struct shape_validator
  {
    std::string_view name;

    std::expected<void, registry_error> operator()(const polar &p) const
    {
      if (!std::isfinite(p.magnitude) || !std::isfinite(p.angle_deg))
      {
        return invalid_geometry(name, "a non-finite magnitude or angle");
      }
      if (p.magnitude < 0.0)
      {
        return invalid_geometry(name, fmt::format("a negative magnitude {}", p.magnitude));
      }
      return {};
    }
    std::expected<void, registry_error> operator()(const cartesian &c) const
    {
      if (!std::isfinite(c.end_x) || !std::isfinite(c.end_y))
      {
        return invalid_geometry(name, "a non-finite end point");
      }
      return {};
    }
  };

  return std::visit(shape_validator{name}, g.shape)
      .and_then(
          [&]() -> std::expected<void, registry_error>
          {
            if (const auto *a = std::get_if<absolute>(&g.anchor);
                a != nullptr && (!std::isfinite(a->x) || !std::isfinite(a->y)))
            {
              return invalid_geometry(name, "a non-finite start point");
            }
            return {};
          });
}

point resolve_end(const point &start, const phasor_shape &shape)
{
  if (const auto *c = std::get_if<cartesian>(&shape))
  {
    return point(c->end_x, c->end_y);
  }
  const auto &p = std::get<polar>(shape);
  return polar_end(start, p.magnitude, p.angle_deg);
}
} // namespace

namespace phasorplot
{
phasor_registry::phasor_registry(duplicate_policy policy) : _policy(policy) {}

std::expected<phasor, registry_error> phasor_registry::add(std::string_view name,
                                                           const geometry_spec &geometry,
                                                           const phasor_style &style)
{
  if (name.empty())
  {
    return std::unexpected(
        registry_error{error_code::invalid_name, "phasor name must not be empty"});
  }
  if (_policy == duplicate_policy::reject && contains(name))
  {
    return std::unexpected(registry_error{error_code::duplicate_name,
                                          fmt::format("phasor '{}' already exists", name)});
  }

  return validate(name, geometry)
      .and_then([&] { return resolve_start(name, geometry.anchor); })
      .and_then(
          [&](const point &start) -> std::expected<phasor, registry_error>
          {
            const auto end = resolve_end(start, geometry.shape);
            const auto color = style.color.value_or(default_color(style.kind));
            auto p = make_phasor(std::string(name), start, end, to_lower(style.kind), color);
            // finite inputs can still overflow once added up
            if (!std::isfinite(p.end.x) || !std::isfinite(p.end.y) || !std::isfinite(p.magnitude))
            {
              return invalid_geometry(name, "an end point or magnitude that overflows");
            }
            insert(p);
            return p;
          });
}

std::expected<phasor, registry_error> phasor_registry::add(const draw_request &request)
{
  return make_geometry(request).and_then(
      [&](const geometry_spec &geometry)
      { return add(request.name, geometry, make_style(request)); });
}

std::optional<phasor> phasor_registry::get(std::string_view name) const
{
  if (auto it = _index.find(name); it != _index.end())
  {
    return _entries[it->second];
  }
  return std::nullopt;
}

bool phasor_registry::contains(std::string_view name) const { return _index.contains(name); }

void phasor_registry::clear()
{
  _entries.clear();
  _index.clear();
}

std::expected<point, registry_error>
phasor_registry::resolve_start(std::string_view name, const phasor_anchor &anchor) const
{
  if (const auto *a = std::get_if<absolute>(&anchor))
  {
    return point(a->x, a->y);
  }

  const auto &ref = std::get<relative_to>(anchor);
  auto it = _index.find(ref.name);
  if (it == _index.end())
  {
    return std::unexpected(
        registry_error{error_code::unknown_reference,
                       fmt::format("phasor '{}' references unknown phasor '{}'", name, ref.name)});
  }
  return point_of(_entries[it->second], ref.ref_point);
}

void phasor_registry::insert(phasor p)
{
  // an overwritten entry moves to the end so creation order stays consistent with references
  if (auto it = _index.find(p.name); it != _index.end())
  {
    const auto pos = it->second;
    _entries.erase(_entries.begin() + static_cast<std::ptrdiff_t>(pos));
    _index.erase(it);
    for (auto &[_, idx] : _index)
    {
      if (idx > pos)
      {
        --idx;
      }
    }
  }
  _index.emplace(p.name, _entries.size());
  _entries.push_back(std::move(p));
}
} // namespace phasorplot
