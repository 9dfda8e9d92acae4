// Ticket: 0001_first_start_bootstrap

#include "osc-data/src/DefaultMetricTypes.hpp"

#include <algorithm>
#include <iterator>
#include <string>

namespace osc_data
{

namespace
{

MetricTypeDefinition planet(const std::string& name,
                            uint32_t color,
                            MetricTypeIcon icon,
                            uint32_t displayOrder)
{
  MetricTypeDefinition definition;
  definition.key = MetricTypeKey::Weight;
  definition.displayName = name;
  definition.unit = UnitType::Kg;
  definition.color = color;
  definition.icon = icon;
  definition.displayOrder = displayOrder;
  definition.isPinned = true;
  definition.isEnabled = true;
  definition.isOnRightYAxis = true;
  return definition;
}

MetricTypeDefinition metric(MetricTypeKey key,
                            UnitType unit,
                            uint32_t color,
                            MetricTypeIcon icon,
                            bool isEnabled,
                            bool isDerived = false,
                            InputFieldType inputType = InputFieldType::Float)
{
  MetricTypeDefinition definition;
  definition.key = key;
  definition.unit = unit;
  definition.color = color;
  definition.icon = icon;
  definition.inputType = inputType;
  definition.isDerived = isDerived;
  definition.isEnabled = isEnabled;
  return definition;
}

}  // namespace

std::vector<MetricTypeDefinition> buildDefaultMetricTypes()
{
  using Icon = MetricTypeIcon;
  using Key = MetricTypeKey;

  std::vector<MetricTypeDefinition> definitions;
  definitions.reserve(36);

  // Planetary weights, ordered by distance from the sun
  definitions.push_back(planet("Mercury", 0xFF8D9094, Icon::PlanetMercury, 1));
  definitions.push_back(planet("Venus", 0xFFE8C766, Icon::PlanetVenus, 2));
  definitions.push_back(planet("Earth", 0xFF4A90E2, Icon::PlanetEarth, 3));
  definitions.push_back(planet("Mars", 0xFFD94F3D, Icon::PlanetMars, 4));
  definitions.push_back(planet("Jupiter", 0xFFD4A574, Icon::PlanetJupiter, 5));
  definitions.push_back(planet("Saturn", 0xFFE8D4A1, Icon::PlanetSaturn, 6));
  definitions.push_back(planet("Uranus", 0xFF67C3C1, Icon::PlanetUranus, 7));
  definitions.push_back(planet("Neptune", 0xFF4169E1, Icon::PlanetNeptune, 8));
  definitions.push_back(planet("Pluto", 0xFFC19A6B, Icon::PlanetPluto, 9));
  definitions.push_back(planet("Moon", 0xFFB0B0B0, Icon::PlanetMoon, 10));

  // Legacy body metrics, disabled
  definitions.push_back(
    metric(Key::Bmi, UnitType::None, 0xFFFFCA28, Icon::Bmi, false, true));
  definitions.push_back(
    metric(Key::BodyFat, UnitType::Percent, 0xFFEF5350, Icon::BodyFat, false));
  definitions.push_back(
    metric(Key::Water, UnitType::Percent, 0xFF29B6F6, Icon::Water, false));
  definitions.push_back(
    metric(Key::Muscle, UnitType::Percent, 0xFF66BB6A, Icon::Muscle, false));
  definitions.push_back(
    metric(Key::Lbm, UnitType::Kg, 0xFF4DBAC0, Icon::Lbm, false));
  definitions.push_back(
    metric(Key::Bone, UnitType::Kg, 0xFFBDBDBD, Icon::Bone, false));
  definitions.push_back(
    metric(Key::Waist, UnitType::Cm, 0xFF78909C, Icon::Waist, false));
  definitions.push_back(
    metric(Key::Whr, UnitType::None, 0xFFFFA726, Icon::Whr, false, true));
  definitions.push_back(
    metric(Key::Whtr, UnitType::None, 0xFFFF7043, Icon::Whtr, false, true));
  definitions.push_back(
    metric(Key::Hips, UnitType::Cm, 0xFF5C6BC0, Icon::Hips, false));
  definitions.push_back(metric(
    Key::VisceralFat, UnitType::None, 0xFFD84315, Icon::VisceralFat, false));
  definitions.push_back(
    metric(Key::Chest, UnitType::Cm, 0xFF8E24AA, Icon::Chest, false));
  definitions.push_back(
    metric(Key::Thigh, UnitType::Cm, 0xFFA1887F, Icon::Thigh, false));
  definitions.push_back(
    metric(Key::Biceps, UnitType::Cm, 0xFFEC407A, Icon::Biceps, false));
  definitions.push_back(
    metric(Key::Neck, UnitType::Cm, 0xFFB0BEC5, Icon::Neck, false));
  definitions.push_back(
    metric(Key::Caliper1, UnitType::Cm, 0xFFFFF59D, Icon::Caliper1, false));
  definitions.push_back(
    metric(Key::Caliper2, UnitType::Cm, 0xFFFFE082, Icon::Caliper2, false));
  definitions.push_back(
    metric(Key::Caliper3, UnitType::Cm, 0xFFFFCC80, Icon::Caliper3, false));
  definitions.push_back(metric(
    Key::Caliper, UnitType::Percent, 0xFFFB8C00, Icon::FatCaliper, false, true));
  definitions.push_back(
    metric(Key::Bmr, UnitType::Kcal, 0xFFAB47BC, Icon::Bmr, false, true));
  definitions.push_back(
    metric(Key::Tdee, UnitType::Kcal, 0xFF26A69A, Icon::Tdee, false, true));
  definitions.push_back(
    metric(Key::Calories, UnitType::Kcal, 0xFF4CAF50, Icon::Calories, false));

  // Entry fields that every measurement carries
  auto comment = metric(Key::Comment,
                        UnitType::None,
                        0xFFE0E0E0,
                        Icon::Comment,
                        true,
                        false,
                        InputFieldType::Text);
  comment.isPinned = true;
  definitions.push_back(comment);
  definitions.push_back(metric(Key::Date,
                               UnitType::None,
                               0xFF9E9E9E,
                               Icon::Date,
                               true,
                               false,
                               InputFieldType::Date));
  definitions.push_back(metric(Key::Time,
                               UnitType::None,
                               0xFF757575,
                               Icon::Time,
                               true,
                               false,
                               InputFieldType::Time));
  definitions.push_back(metric(Key::User,
                               UnitType::None,
                               0xFF90A4AE,
                               Icon::User,
                               true,
                               false,
                               InputFieldType::User));

  return definitions;
}

std::vector<MetricTypeDefinition> pinnedMetricTypes(
  const std::vector<MetricTypeDefinition>& definitions)
{
  std::vector<MetricTypeDefinition> pinned;
  std::copy_if(definitions.begin(),
               definitions.end(),
               std::back_inserter(pinned),
               [](const MetricTypeDefinition& definition)
               { return definition.isEnabled && definition.isPinned; });

  std::stable_sort(pinned.begin(),
                   pinned.end(),
                   [](const MetricTypeDefinition& a,
                      const MetricTypeDefinition& b)
                   { return a.displayOrder < b.displayOrder; });
  return pinned;
}

}  // namespace osc_data
