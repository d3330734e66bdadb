#pragma once

#include <cstddef>
#include <expected>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include "errors.hpp"
#include "geometry_spec.hpp"
#include "phasor.hpp"

namespace phasorplot
{
enum class duplicate_policy
{
  reject,
  overwrite
};

// Named phasors in creation order. A new phasor may only anchor on an entry that already
// exists, so the reference chain is acyclic by construction. Entries are stored by value and
// never modified; an overwrite replaces the record but phasors resolved against the old one
// keep the coordinates they copied.
class phasor_registry
{
public:
  explicit phasor_registry(duplicate_policy policy = duplicate_policy::reject);

  std::expected<phasor, registry_error> add(std::string_view name, const geometry_spec &geometry,
                                            const phasor_style &style = {});
  std::expected<phasor, registry_error> add(const draw_request &request);

  std::optional<phasor> get(std::string_view name) const;
  bool contains(std::string_view name) const;
  void clear();

  std::span<const phasor> phasors() const { return _entries; }
  std::size_t size() const { return _entries.size(); }
  bool empty() const { return _entries.empty(); }

  duplicate_policy policy() const { return _policy; }
  void set_duplicate_policy(duplicate_policy policy) { _policy = policy; }

private:
  struct name_hash
  {
    using is_transparent = void;
    std::size_t operator()(std::string_view s) const { return std::hash<std::string_view>{}(s); }
  };

  std::expected<point, registry_error> resolve_start(std::string_view name,
                                                     const phasor_anchor &anchor) const;
  void insert(phasor p);

  std::vector<phasor> _entries;
  std::unordered_map<std::string, std::size_t, name_hash, std::equal_to<>> _index;
  duplicate_policy _policy;
};
} // namespace phasorplot
