#include <gtest/gtest.h>
#include <cmath>
#include <numbers>
#include <string>
#include <vector>
#include "colors.hpp"
#include "registry.hpp"

using namespace phasorplot;

namespace
{
geometry_spec polar_at_origin(double magnitude, double angle_deg)
{
  return geometry_spec{.shape = polar{.magnitude = magnitude, .angle_deg = angle_deg}};
}

geometry_spec polar_from(std::string ref, endpoint which, double magnitude, double angle_deg)
{
  return geometry_spec{.shape = polar{.magnitude = magnitude, .angle_deg = angle_deg},
                       .anchor = relative_to{.name = std::move(ref), .ref_point = which}};
}

std::vector<std::string> names(const phasor_registry &registry)
{
  auto result = std::vector<std::string>();
  for (const auto &p : registry.phasors())
  {
    result.push_back(p.name);
  }
  return result;
}
} // namespace

TEST(registry, polar_at_origin_resolves_end)
{
  auto registry = phasor_registry();
  auto vs = registry.add("Vs", polar_at_origin(10.0, 0.0));
  ASSERT_TRUE(vs.has_value());
  EXPECT_EQ(vs->start, point(0.0, 0.0));
  EXPECT_NEAR(vs->end.x, 10.0, 1e-12);
  EXPECT_NEAR(vs->end.y, 0.0, 1e-12);
  EXPECT_NEAR(vs->magnitude, 10.0, 1e-12);
  EXPECT_NEAR(vs->angle_deg, 0.0, 1e-12);
  EXPECT_EQ(vs->kind, "voltage");
  EXPECT_EQ(vs->color, voltage_color);
}

TEST(registry, reference_to_end_copies_coordinates)
{
  auto registry = phasor_registry();
  auto vs = registry.add("Vs", polar_at_origin(10.0, 0.0));
  ASSERT_TRUE(vs.has_value());
  auto vl = registry.add("Vl", polar_from("Vs", endpoint::end, 2.0, 150.0));
  ASSERT_TRUE(vl.has_value());
  EXPECT_EQ(vl->start, vs->end);
  EXPECT_NEAR(vl->end.x, 8.2679492, 1e-6);
  EXPECT_NEAR(vl->end.y, 1.0, 1e-9);
  EXPECT_NEAR(vl->magnitude, 2.0, 1e-9);
  EXPECT_NEAR(vl->angle_deg, 150.0, 1e-9);
}

TEST(registry, reference_to_start)
{
  auto registry = phasor_registry();
  ASSERT_TRUE(registry.add("a", geometry_spec{.shape = cartesian{.end_x = 4.0, .end_y = 4.0},
                                               .anchor = absolute{.x = 1.0, .y = 2.0}}));
  auto b = registry.add("b", polar_from("a", endpoint::start, 1.0, 90.0));
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(b->start, point(1.0, 2.0));
  EXPECT_NEAR(b->end.x, 1.0, 1e-12);
  EXPECT_NEAR(b->end.y, 3.0, 1e-12);
}

TEST(registry, cartesian_end_derives_magnitude_and_angle)
{
  auto registry = phasor_registry();
  auto vr = registry.add("Vr", geometry_spec{.shape = cartesian{.end_x = 8.5, .end_y = 2.2}});
  ASSERT_TRUE(vr.has_value());
  EXPECT_EQ(vr->end, point(8.5, 2.2));
  EXPECT_NEAR(vr->magnitude, 8.78, 0.01);
  EXPECT_NEAR(vr->angle_deg, 14.5, 0.05);
}

TEST(registry, polar_round_trips_over_angle_sweep)
{
  auto registry = phasor_registry(duplicate_policy::overwrite);
  for (auto angle = -720.0; angle <= 720.0; angle += 37.5)
  {
    for (const auto magnitude : {0.5, 1.0, 7.25, 1000.0})
    {
      auto p = registry.add("p", polar_at_origin(magnitude, angle));
      ASSERT_TRUE(p.has_value());
      const auto rad = angle * std::numbers::pi / 180.0;
      EXPECT_NEAR(p->end.x, magnitude * std::cos(rad), 1e-9 * magnitude);
      EXPECT_NEAR(p->end.y, magnitude * std::sin(rad), 1e-9 * magnitude);
      EXPECT_NEAR(p->magnitude, magnitude, 1e-9 * magnitude);
      EXPECT_GT(p->angle_deg, -180.0);
      EXPECT_LE(p->angle_deg, 180.0);
      const auto diff = std::remainder(p->angle_deg - angle, 360.0);
      EXPECT_NEAR(diff, 0.0, 1e-7);
    }
  }
}

TEST(registry, angle_of_exact_opposite_is_180)
{
  auto registry = phasor_registry();
  auto p = registry.add("p", geometry_spec{.shape = cartesian{.end_x = -3.0, .end_y = 0.0}});
  ASSERT_TRUE(p.has_value());
  EXPECT_NEAR(p->angle_deg, 180.0, 1e-12);
}

TEST(registry, zero_length_phasor)
{
  auto registry = phasor_registry();
  auto p = registry.add("z", polar_at_origin(0.0, 45.0));
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(p->start, p->end);
  EXPECT_EQ(p->magnitude, 0.0);
  EXPECT_EQ(p->angle_deg, 0.0);
}

TEST(registry, get_unknown_is_absent)
{
  auto registry = phasor_registry();
  EXPECT_FALSE(registry.get("nothing").has_value());
  EXPECT_FALSE(registry.contains("nothing"));
}

TEST(registry, unknown_reference_leaves_registry_unchanged)
{
  auto registry = phasor_registry();
  ASSERT_TRUE(registry.add("Vs", polar_at_origin(10.0, 0.0)));
  auto p = registry.add("Vl", polar_from("Vx", endpoint::end, 2.0, 150.0));
  ASSERT_FALSE(p.has_value());
  EXPECT_EQ(p.error().code, error_code::unknown_reference);
  EXPECT_NE(p.error().message.find("Vx"), std::string::npos);
  EXPECT_EQ(registry.size(), 1u);
  EXPECT_FALSE(registry.contains("Vl"));
}

TEST(registry, self_reference_is_unknown)
{
  auto registry = phasor_registry();
  auto p = registry.add("a", polar_from("a", endpoint::end, 1.0, 0.0));
  ASSERT_FALSE(p.has_value());
  EXPECT_EQ(p.error().code, error_code::unknown_reference);
  EXPECT_TRUE(registry.empty());
}

TEST(registry, missing_geometry_from_request)
{
  auto registry = phasor_registry();
  auto p = registry.add(draw_request{.name = "V", .magnitude = 5.0});
  ASSERT_FALSE(p.has_value());
  EXPECT_EQ(p.error().code, error_code::missing_geometry);
  EXPECT_TRUE(registry.empty());

  auto q = registry.add(draw_request{.name = "V", .angle_deg = 5.0, .end_x = 1.0});
  ASSERT_FALSE(q.has_value());
  EXPECT_EQ(q.error().code, error_code::missing_geometry);
}

TEST(registry, empty_name_is_rejected)
{
  auto registry = phasor_registry();
  auto p = registry.add("", polar_at_origin(1.0, 0.0));
  ASSERT_FALSE(p.has_value());
  EXPECT_EQ(p.error().code, error_code::invalid_name);
}

TEST(registry, invalid_geometry)
{
  auto registry = phasor_registry();
  auto negative = registry.add("n", polar_at_origin(-1.0, 0.0));
  ASSERT_FALSE(negative.has_value());
  EXPECT_EQ(negative.error().code, error_code::invalid_geometry);

  auto nan_end = registry.add(
      "n", geometry_spec{.shape = cartesian{.end_x = std::nan(""), .end_y = 0.0}});
  ASSERT_FALSE(nan_end.has_value());
  EXPECT_EQ(nan_end.error().code, error_code::invalid_geometry);

  auto inf_start = registry.add(
      "n", geometry_spec{.shape = polar{.magnitude = 1.0, .angle_deg = 0.0},
                         .anchor = absolute{.x = INFINITY, .y = 0.0}});
  ASSERT_FALSE(inf_start.has_value());
  EXPECT_EQ(inf_start.error().code, error_code::invalid_geometry);
  EXPECT_TRUE(registry.empty());
}

TEST(registry, overflowing_end_is_invalid)
{
  auto registry = phasor_registry();
  auto polar_overflow = registry.add(
      "o", geometry_spec{.shape = polar{.magnitude = 1e308, .angle_deg = 0.0},
                         .anchor = absolute{.x = 1e308, .y = 0.0}});
  ASSERT_FALSE(polar_overflow.has_value());
  EXPECT_EQ(polar_overflow.error().code, error_code::invalid_geometry);

  auto long_span = registry.add(
      "o", geometry_spec{.shape = cartesian{.end_x = 1e308, .end_y = 0.0},
                         .anchor = absolute{.x = -1e308, .y = 0.0}});
  ASSERT_FALSE(long_span.has_value());
  EXPECT_EQ(long_span.error().code, error_code::invalid_geometry);
  EXPECT_TRUE(registry.empty());
}

TEST(registry, error_code_names)
{
  EXPECT_EQ(to_string(error_code::unknown_reference), "unknown reference");
  EXPECT_EQ(to_string(error_code::missing_geometry), "missing geometry");
  EXPECT_EQ(to_string(error_code::duplicate_name), "duplicate name");
  EXPECT_EQ(to_string(error_code::invalid_name), "invalid name");
  EXPECT_EQ(to_string(error_code::invalid_geometry), "invalid geometry");
  EXPECT_EQ(to_string(error_code::conflicting_anchor), "conflicting anchor");
}

TEST(registry, duplicate_rejected_by_default)
{
  auto registry = phasor_registry();
  ASSERT_TRUE(registry.add("V", polar_at_origin(1.0, 0.0)));
  auto again = registry.add("V", polar_at_origin(2.0, 90.0));
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().code, error_code::duplicate_name);
  EXPECT_NEAR(registry.get("V")->magnitude, 1.0, 1e-12);
  EXPECT_EQ(registry.size(), 1u);
}

TEST(registry, overwrite_keeps_copied_coordinates)
{
  auto registry = phasor_registry(duplicate_policy::overwrite);
  ASSERT_TRUE(registry.add("A", polar_at_origin(10.0, 0.0)));
  auto b = registry.add("B", polar_from("A", endpoint::end, 1.0, 90.0));
  ASSERT_TRUE(b.has_value());

  auto a2 = registry.add("A", geometry_spec{.shape = cartesian{.end_x = 0.0, .end_y = 5.0}});
  ASSERT_TRUE(a2.has_value());
  EXPECT_EQ(registry.get("A")->end, point(0.0, 5.0));
  EXPECT_EQ(registry.get("B")->start, b->start);
  EXPECT_NEAR(registry.get("B")->start.x, 10.0, 1e-12);
  EXPECT_EQ(names(registry), (std::vector<std::string>{"B", "A"}));
}

TEST(registry, overwrite_may_reference_previous_entry_of_same_name)
{
  auto registry = phasor_registry(duplicate_policy::overwrite);
  ASSERT_TRUE(registry.add("A", polar_at_origin(1.0, 0.0)));
  auto a = registry.add("A", polar_from("A", endpoint::end, 1.0, 0.0));
  ASSERT_TRUE(a.has_value());
  EXPECT_EQ(a->start, point(1.0, 0.0));
  EXPECT_NEAR(a->end.x, 2.0, 1e-12);
  EXPECT_EQ(registry.size(), 1u);
}

TEST(registry, preserves_creation_order)
{
  auto registry = phasor_registry();
  ASSERT_TRUE(registry.add("c", polar_at_origin(1.0, 0.0)));
  ASSERT_TRUE(registry.add("a", polar_from("c", endpoint::end, 1.0, 0.0)));
  ASSERT_TRUE(registry.add("b", polar_from("a", endpoint::end, 1.0, 0.0)));
  EXPECT_EQ(names(registry), (std::vector<std::string>{"c", "a", "b"}));
}

TEST(registry, clear_then_get_is_absent)
{
  auto registry = phasor_registry();
  ASSERT_TRUE(registry.add("Vs", polar_at_origin(10.0, 0.0)));
  registry.clear();
  EXPECT_TRUE(registry.empty());
  EXPECT_FALSE(registry.get("Vs").has_value());
  EXPECT_TRUE(registry.add("Vs", polar_at_origin(3.0, 0.0)));
}

TEST(registry, kind_selects_default_color)
{
  auto registry = phasor_registry();
  auto i = registry.add("I", polar_at_origin(1.0, 0.0), phasor_style{.kind = "Current"});
  ASSERT_TRUE(i.has_value());
  EXPECT_EQ(i->kind, "current");
  EXPECT_EQ(i->color, current_color);

  auto f = registry.add("F", polar_at_origin(1.0, 0.0), phasor_style{.kind = "flux"});
  ASSERT_TRUE(f.has_value());
  EXPECT_EQ(f->color, neutral_color);

  auto c = registry.add("C", polar_at_origin(1.0, 0.0),
                        phasor_style{.kind = "current", .color = from_rgb(0x00ff00)});
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(c->color, from_rgb(0x00ff00));
}
