#include "session.hpp"
#include <vector>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include "chain.hpp"
#include "diagram.hpp"
#include "report.hpp"
#include "settings.hpp"

namespace
{
using namespace phasorplot;

std::string to_message(const registry_error &e)
{
  return fmt::format("{}: {}", to_string(e.code), e.message);
}

struct executor
{
  session &s;

  std::expected<std::string, std::string> operator()(const phasor_command &cmd) const
  {
    s.registry.set_duplicate_policy(settings::duplicates());
    auto request = cmd.request;
    if (!request.kind)
    {
      request.kind = settings::kind();
    }
    return s.registry.add(request)
        .transform([](const phasor &p) { return describe(p, settings::precision()); })
        .transform_error(to_message);
  }

  std::expected<std::string, std::string> operator()(const chain_command &cmd) const
  {
    s.registry.set_duplicate_policy(settings::duplicates());
    const auto style = phasor_style{.kind = cmd.kind.value_or(settings::kind())};
    return add_chain(s.registry, cmd.origin, cmd.links, style)
        .transform(
            [](const std::vector<phasor> &added)
            {
              auto lines = std::vector<std::string>();
              for (const auto &p : added)
              {
                lines.push_back(describe(p, settings::precision()));
              }
              return fmt::format("{}", fmt::join(lines, "\n"));
            })
        .transform_error(to_message);
  }

  std::expected<std::string, std::string> operator()(const show_command &cmd) const
  {
    if (const auto *name = std::get_if<std::string>(&cmd.target))
    {
      if (auto p = s.registry.get(*name); p)
      {
        return describe(*p, settings::precision());
      }
      return std::unexpected(fmt::format("no phasor named '{}'", *name));
    }
    return settings::show(std::get<any_setting>(cmd.target));
  }

  std::expected<std::string, std::string> operator()(const list_command &) const
  {
    if (s.registry.empty())
    {
      return "no phasors";
    }
    auto lines = std::vector<std::string>();
    for (const auto &a : arrows(s.registry, settings::label_offset()))
    {
      lines.push_back(describe(a, settings::precision()));
    }
    return fmt::format("{}", fmt::join(lines, "\n"));
  }

  std::expected<std::string, std::string> operator()(const bounds_command &) const
  {
    if (auto view = auto_scale(s.registry, settings::margin(), settings::min_margin()); view)
    {
      return describe(*view, settings::precision());
    }
    return "no phasors";
  }

  std::expected<std::string, std::string> operator()(const clear_command &) const
  {
    s.registry.clear();
    return "";
  }

  std::expected<std::string, std::string> operator()(const set_command &cmd) const
  {
    settings::set(cmd.value);
    return "";
  }

  std::expected<std::string, std::string> operator()(const unset_command &cmd) const
  {
    settings::unset(cmd.setting);
    return "";
  }

  std::expected<std::string, std::string> operator()(const quit_command &) const { return ""; }
};
} // namespace

namespace phasorplot
{
std::expected<std::string, std::string> execute(session &s, const command &cmd)
{
  return std::visit(executor{s}, cmd);
}
} // namespace phasorplot
