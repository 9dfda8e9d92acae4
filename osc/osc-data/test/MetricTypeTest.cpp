// Ticket: 0001_first_start_bootstrap
// Test: MetricTypeDefinition conversions

#include <gtest/gtest.h>

#include <stdexcept>

#include "osc-data/src/MetricType.hpp"

namespace osc_data
{
namespace test
{

namespace
{

MetricTypeDefinition makeVenus()
{
  MetricTypeDefinition definition;
  definition.key = MetricTypeKey::Weight;
  definition.displayName = "Venus";
  definition.unit = UnitType::Kg;
  definition.color = 0xFFE8C766;
  definition.icon = MetricTypeIcon::PlanetVenus;
  definition.displayOrder = 2;
  definition.isPinned = true;
  definition.isOnRightYAxis = true;
  return definition;
}

}  // namespace

TEST(MetricTypeTest, Label_PrefersDisplayName)
{
  EXPECT_EQ(makeVenus().label(), "Venus");
}

TEST(MetricTypeTest, Label_FallsBackToKeyName)
{
  MetricTypeDefinition definition;
  definition.key = MetricTypeKey::BodyFat;

  EXPECT_EQ(definition.label(), "Body fat");
}

TEST(MetricTypeTest, ToRecord_CopiesEveryField)
{
  auto const record = makeVenus().toRecord();

  EXPECT_EQ(record.id, 0);
  EXPECT_EQ(record.type_key, static_cast<uint32_t>(MetricTypeKey::Weight));
  EXPECT_EQ(record.name, "Venus");
  EXPECT_EQ(record.unit, static_cast<uint32_t>(UnitType::Kg));
  EXPECT_EQ(record.color, 0xFFE8C766u);
  EXPECT_EQ(record.icon, static_cast<uint32_t>(MetricTypeIcon::PlanetVenus));
  EXPECT_EQ(record.display_order, 2u);
  EXPECT_EQ(record.is_pinned, 1u);
  EXPECT_EQ(record.is_enabled, 1u);
  EXPECT_EQ(record.is_derived, 0u);
  EXPECT_EQ(record.is_on_right_y_axis, 1u);
}

TEST(MetricTypeTest, FromRecord_RestoresDefinition)
{
  auto const original = makeVenus();

  EXPECT_EQ(MetricTypeDefinition::fromRecord(original.toRecord()), original);
}

TEST(MetricTypeTest, FromRecord_EmptyNameMeansNoDisplayName)
{
  MetricTypeDefinition definition;
  definition.key = MetricTypeKey::Comment;
  definition.inputType = InputFieldType::Text;

  auto const restored =
    MetricTypeDefinition::fromRecord(definition.toRecord());

  EXPECT_FALSE(restored.displayName.has_value());
  EXPECT_EQ(restored.label(), "Comment");
}

TEST(MetricTypeTest, FromRecord_UnknownKey_Throws)
{
  auto record = makeVenus().toRecord();
  record.type_key = 999;

  EXPECT_THROW(MetricTypeDefinition::fromRecord(record), std::runtime_error);
}

TEST(MetricTypeTest, FromRecord_UnknownIcon_Throws)
{
  auto record = makeVenus().toRecord();
  record.icon = 0;

  EXPECT_THROW(MetricTypeDefinition::fromRecord(record), std::runtime_error);
}

TEST(MetricTypeTest, ToString_Units)
{
  EXPECT_EQ(toString(UnitType::Kg), "kg");
  EXPECT_EQ(toString(UnitType::Percent), "%");
  EXPECT_EQ(toString(UnitType::None), "");
}

}  // namespace test
}  // namespace osc_data
