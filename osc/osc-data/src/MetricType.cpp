// Ticket: 0001_first_start_bootstrap

#include "osc-data/src/MetricType.hpp"

#include <stdexcept>
#include <string>

namespace osc_data
{

namespace
{

template <typename Enum>
Enum checkedEnum(uint32_t value,
                 uint32_t minValue,
                 uint32_t maxValue,
                 const char* column)
{
  if (value < minValue || value > maxValue)
  {
    throw std::runtime_error{"MetricTypeRecord: invalid " +
                             std::string{column} + " value " +
                             std::to_string(value)};
  }
  return static_cast<Enum>(value);
}

}  // namespace

std::string_view toString(MetricTypeKey key)
{
  switch (key)
  {
    case MetricTypeKey::Weight:
      return "Weight";
    case MetricTypeKey::Bmi:
      return "BMI";
    case MetricTypeKey::BodyFat:
      return "Body fat";
    case MetricTypeKey::Water:
      return "Water";
    case MetricTypeKey::Muscle:
      return "Muscle";
    case MetricTypeKey::Lbm:
      return "Lean body mass";
    case MetricTypeKey::Bone:
      return "Bone mass";
    case MetricTypeKey::Waist:
      return "Waist";
    case MetricTypeKey::Whr:
      return "Waist-hip ratio";
    case MetricTypeKey::Whtr:
      return "Waist-height ratio";
    case MetricTypeKey::Hips:
      return "Hips";
    case MetricTypeKey::VisceralFat:
      return "Visceral fat";
    case MetricTypeKey::Chest:
      return "Chest";
    case MetricTypeKey::Thigh:
      return "Thigh";
    case MetricTypeKey::Biceps:
      return "Biceps";
    case MetricTypeKey::Neck:
      return "Neck";
    case MetricTypeKey::Caliper1:
      return "Caliper 1";
    case MetricTypeKey::Caliper2:
      return "Caliper 2";
    case MetricTypeKey::Caliper3:
      return "Caliper 3";
    case MetricTypeKey::Caliper:
      return "Caliper body fat";
    case MetricTypeKey::Bmr:
      return "BMR";
    case MetricTypeKey::Tdee:
      return "TDEE";
    case MetricTypeKey::Calories:
      return "Calories";
    case MetricTypeKey::Comment:
      return "Comment";
    case MetricTypeKey::Date:
      return "Date";
    case MetricTypeKey::Time:
      return "Time";
    case MetricTypeKey::User:
      return "User";
    case MetricTypeKey::Custom:
      return "Custom";
  }
  return "Unknown";
}

std::string_view toString(UnitType unit)
{
  switch (unit)
  {
    case UnitType::None:
      return "";
    case UnitType::Kg:
      return "kg";
    case UnitType::Lb:
      return "lb";
    case UnitType::St:
      return "st";
    case UnitType::Percent:
      return "%";
    case UnitType::Cm:
      return "cm";
    case UnitType::Inch:
      return "in";
    case UnitType::Count:
      return "#";
    case UnitType::Kcal:
      return "kcal";
  }
  return "?";
}

std::string_view toString(InputFieldType inputType)
{
  switch (inputType)
  {
    case InputFieldType::Float:
      return "float";
    case InputFieldType::Int:
      return "int";
    case InputFieldType::Text:
      return "text";
    case InputFieldType::Date:
      return "date";
    case InputFieldType::Time:
      return "time";
    case InputFieldType::User:
      return "user";
  }
  return "unknown";
}

std::string MetricTypeDefinition::label() const
{
  if (displayName.has_value())
  {
    return *displayName;
  }
  return std::string{toString(key)};
}

osc_transfer::MetricTypeRecord MetricTypeDefinition::toRecord() const
{
  osc_transfer::MetricTypeRecord record{};
  record.type_key = static_cast<uint32_t>(key);
  record.name = displayName.value_or("");
  record.unit = static_cast<uint32_t>(unit);
  record.color = color;
  record.icon = static_cast<uint32_t>(icon);
  record.input_type = static_cast<uint32_t>(inputType);
  record.display_order = displayOrder;
  record.is_derived = isDerived ? 1 : 0;
  record.is_pinned = isPinned ? 1 : 0;
  record.is_enabled = isEnabled ? 1 : 0;
  record.is_on_right_y_axis = isOnRightYAxis ? 1 : 0;
  return record;
}

MetricTypeDefinition MetricTypeDefinition::fromRecord(
  const osc_transfer::MetricTypeRecord& record)
{
  MetricTypeDefinition definition;
  definition.key = checkedEnum<MetricTypeKey>(
    record.type_key,
    static_cast<uint32_t>(MetricTypeKey::Weight),
    static_cast<uint32_t>(MetricTypeKey::Custom),
    "type_key");
  if (!record.name.empty())
  {
    definition.displayName = record.name;
  }
  definition.unit =
    checkedEnum<UnitType>(record.unit,
                          static_cast<uint32_t>(UnitType::None),
                          static_cast<uint32_t>(UnitType::Kcal),
                          "unit");
  definition.color = record.color;
  definition.icon = checkedEnum<MetricTypeIcon>(
    record.icon,
    static_cast<uint32_t>(MetricTypeIcon::PlanetMercury),
    static_cast<uint32_t>(MetricTypeIcon::Default),
    "icon");
  definition.inputType = checkedEnum<InputFieldType>(
    record.input_type,
    static_cast<uint32_t>(InputFieldType::Float),
    static_cast<uint32_t>(InputFieldType::User),
    "input_type");
  definition.displayOrder = record.display_order;
  definition.isDerived = record.is_derived != 0;
  definition.isPinned = record.is_pinned != 0;
  definition.isEnabled = record.is_enabled != 0;
  definition.isOnRightYAxis = record.is_on_right_y_axis != 0;
  return definition;
}

}  // namespace osc_data
