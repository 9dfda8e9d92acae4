// Ticket: 0001_first_start_bootstrap
// Test: Default metric-type dataset

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <string>

#include "osc-data/src/DefaultMetricTypes.hpp"

namespace osc_data
{
namespace test
{

namespace
{

std::vector<MetricTypeDefinition> planets(
  const std::vector<MetricTypeDefinition>& definitions)
{
  std::vector<MetricTypeDefinition> result;
  std::copy_if(definitions.begin(),
               definitions.end(),
               std::back_inserter(result),
               [](const MetricTypeDefinition& d)
               { return d.key == MetricTypeKey::Weight; });
  return result;
}

}  // namespace

// ========== Dataset contents ==========

TEST(DefaultMetricTypesTest, Build_IsPure)
{
  EXPECT_EQ(buildDefaultMetricTypes(), buildDefaultMetricTypes());
}

TEST(DefaultMetricTypesTest, Build_Returns36Definitions)
{
  EXPECT_EQ(buildDefaultMetricTypes().size(), 36u);
}

TEST(DefaultMetricTypesTest, Planets_OrderedByDistanceFromSun)
{
  auto const weights = planets(buildDefaultMetricTypes());
  const std::array<std::string, 10> expected{"Mercury",
                                             "Venus",
                                             "Earth",
                                             "Mars",
                                             "Jupiter",
                                             "Saturn",
                                             "Uranus",
                                             "Neptune",
                                             "Pluto",
                                             "Moon"};

  ASSERT_EQ(weights.size(), expected.size());
  for (std::size_t i = 0; i < expected.size(); ++i)
  {
    EXPECT_EQ(weights[i].label(), expected[i]);
    EXPECT_EQ(weights[i].displayOrder, i + 1);
  }
}

TEST(DefaultMetricTypesTest, Planets_PinnedEnabledKgOnRightAxis)
{
  for (const auto& planet : planets(buildDefaultMetricTypes()))
  {
    SCOPED_TRACE(planet.label());
    EXPECT_EQ(planet.unit, UnitType::Kg);
    EXPECT_EQ(planet.inputType, InputFieldType::Float);
    EXPECT_TRUE(planet.isPinned);
    EXPECT_TRUE(planet.isEnabled);
    EXPECT_TRUE(planet.isOnRightYAxis);
    EXPECT_FALSE(planet.isDerived);
  }
}

TEST(DefaultMetricTypesTest, Planets_HaveDistinctColorsAndIcons)
{
  auto const weights = planets(buildDefaultMetricTypes());

  for (std::size_t i = 0; i < weights.size(); ++i)
  {
    for (std::size_t j = i + 1; j < weights.size(); ++j)
    {
      EXPECT_NE(weights[i].color, weights[j].color);
      EXPECT_NE(weights[i].icon, weights[j].icon);
    }
  }
  EXPECT_EQ(weights.front().color, 0xFF8D9094u);
  EXPECT_EQ(weights[2].icon, MetricTypeIcon::PlanetEarth);
  EXPECT_EQ(weights.back().icon, MetricTypeIcon::PlanetMoon);
}

TEST(DefaultMetricTypesTest, BodyMetrics_AreDisabled)
{
  auto const definitions = buildDefaultMetricTypes();

  for (const auto& definition : definitions)
  {
    switch (definition.key)
    {
      case MetricTypeKey::Weight:
      case MetricTypeKey::Comment:
      case MetricTypeKey::Date:
      case MetricTypeKey::Time:
      case MetricTypeKey::User:
        EXPECT_TRUE(definition.isEnabled) << definition.label();
        break;
      default:
        EXPECT_FALSE(definition.isEnabled) << definition.label();
        EXPECT_FALSE(definition.isPinned) << definition.label();
        break;
    }
  }
}

TEST(DefaultMetricTypesTest, DerivedMetrics_AreMarked)
{
  auto const definitions = buildDefaultMetricTypes();
  auto const derivedCount =
    std::count_if(definitions.begin(),
                  definitions.end(),
                  [](const MetricTypeDefinition& d) { return d.isDerived; });

  EXPECT_EQ(derivedCount, 6);
  for (const auto& definition : definitions)
  {
    if (definition.key == MetricTypeKey::Bmi ||
        definition.key == MetricTypeKey::Bmr)
    {
      EXPECT_TRUE(definition.isDerived);
    }
  }
}

TEST(DefaultMetricTypesTest, EntryFields_UseMatchingInputTypes)
{
  auto const definitions = buildDefaultMetricTypes();
  auto const find = [&definitions](MetricTypeKey key)
  {
    return *std::find_if(definitions.begin(),
                         definitions.end(),
                         [key](const MetricTypeDefinition& d)
                         { return d.key == key; });
  };

  EXPECT_EQ(find(MetricTypeKey::Comment).inputType, InputFieldType::Text);
  EXPECT_TRUE(find(MetricTypeKey::Comment).isPinned);
  EXPECT_EQ(find(MetricTypeKey::Date).inputType, InputFieldType::Date);
  EXPECT_EQ(find(MetricTypeKey::Time).inputType, InputFieldType::Time);
  EXPECT_EQ(find(MetricTypeKey::User).inputType, InputFieldType::User);
}

// ========== pinnedMetricTypes ==========

TEST(DefaultMetricTypesTest, Pinned_CommentThenPlanets)
{
  auto const pinned = pinnedMetricTypes(buildDefaultMetricTypes());

  ASSERT_EQ(pinned.size(), 11u);
  EXPECT_EQ(pinned.front().key, MetricTypeKey::Comment);
  EXPECT_EQ(pinned[1].label(), "Mercury");
  EXPECT_EQ(pinned.back().label(), "Moon");
}

TEST(DefaultMetricTypesTest, Pinned_SkipsDisabledAndKeepsTiesStable)
{
  MetricTypeDefinition a;
  a.displayName = "a";
  a.isPinned = true;
  a.displayOrder = 5;

  MetricTypeDefinition b = a;
  b.displayName = "b";

  MetricTypeDefinition c = a;
  c.displayName = "c";
  c.displayOrder = 1;

  MetricTypeDefinition hidden = a;
  hidden.displayName = "hidden";
  hidden.isEnabled = false;

  MetricTypeDefinition unpinned = a;
  unpinned.displayName = "unpinned";
  unpinned.isPinned = false;

  auto const pinned = pinnedMetricTypes({a, hidden, b, unpinned, c});

  ASSERT_EQ(pinned.size(), 3u);
  EXPECT_EQ(pinned[0].label(), "c");
  EXPECT_EQ(pinned[1].label(), "a");
  EXPECT_EQ(pinned[2].label(), "b");
}

TEST(DefaultMetricTypesTest, Pinned_EmptyInput)
{
  EXPECT_TRUE(pinnedMetricTypes({}).empty());
}

}  // namespace test
}  // namespace osc_data
