// Ticket: 0001_first_start_bootstrap

#ifndef OSC_DATA_METRIC_TYPE_HPP
#define OSC_DATA_METRIC_TYPE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "osc-transfer/src/MetricTypeRecord.hpp"

namespace osc_data
{

/**
 * @brief Semantic category of a trackable quantity
 *
 * Values are persisted; never renumber an existing entry.
 */
enum class MetricTypeKey : uint32_t
{
  Weight = 1,
  Bmi = 2,
  BodyFat = 3,
  Water = 4,
  Muscle = 5,
  Lbm = 6,
  Bone = 7,
  Waist = 8,
  Whr = 9,
  Whtr = 10,
  Hips = 11,
  VisceralFat = 12,
  Chest = 13,
  Thigh = 14,
  Biceps = 15,
  Neck = 16,
  Caliper1 = 17,
  Caliper2 = 18,
  Caliper3 = 19,
  Caliper = 20,
  Bmr = 21,
  Tdee = 22,
  Calories = 23,
  Comment = 24,
  Date = 25,
  Time = 26,
  User = 27,
  Custom = 28
};

enum class UnitType : uint32_t
{
  None = 0,
  Kg = 1,
  Lb = 2,
  St = 3,
  Percent = 4,
  Cm = 5,
  Inch = 6,
  Count = 7,
  Kcal = 8
};

/**
 * @brief How a value of a metric type is entered and rendered
 */
enum class InputFieldType : uint32_t
{
  Float = 0,
  Int = 1,
  Text = 2,
  Date = 3,
  Time = 4,
  User = 5
};

enum class MetricTypeIcon : uint32_t
{
  PlanetMercury = 1,
  PlanetVenus = 2,
  PlanetEarth = 3,
  PlanetMars = 4,
  PlanetJupiter = 5,
  PlanetSaturn = 6,
  PlanetUranus = 7,
  PlanetNeptune = 8,
  PlanetPluto = 9,
  PlanetMoon = 10,
  Bmi = 11,
  BodyFat = 12,
  Water = 13,
  Muscle = 14,
  Lbm = 15,
  Bone = 16,
  Waist = 17,
  Whr = 18,
  Whtr = 19,
  Hips = 20,
  VisceralFat = 21,
  Chest = 22,
  Thigh = 23,
  Biceps = 24,
  Neck = 25,
  Caliper1 = 26,
  Caliper2 = 27,
  Caliper3 = 28,
  FatCaliper = 29,
  Bmr = 30,
  Tdee = 31,
  Calories = 32,
  Comment = 33,
  Date = 34,
  Time = 35,
  User = 36,
  Default = 37
};

std::string_view toString(MetricTypeKey key);
std::string_view toString(UnitType unit);
std::string_view toString(InputFieldType inputType);

/**
 * @brief Configuration record describing one trackable quantity
 *
 * Plain value type. Several definitions may share the same key (the planet
 * weight channels all use MetricTypeKey::Weight and differ by name, color
 * and icon); each is stored as an independent channel.
 */
struct MetricTypeDefinition
{
  MetricTypeKey key{MetricTypeKey::Custom};
  std::optional<std::string> displayName;
  UnitType unit{UnitType::None};
  uint32_t color{0};  // ARGB
  MetricTypeIcon icon{MetricTypeIcon::Default};
  InputFieldType inputType{InputFieldType::Float};
  uint32_t displayOrder{0};
  bool isDerived{false};
  bool isPinned{false};
  bool isEnabled{true};
  bool isOnRightYAxis{false};

  /**
   * @brief Label shown to the user
   * @return The display name if present, otherwise the key's default label
   */
  std::string label() const;

  /**
   * @brief Convert to the database transfer object
   *
   * The returned record has id 0; the database assigns it on insert.
   */
  osc_transfer::MetricTypeRecord toRecord() const;

  /**
   * @brief Rebuild a definition from its database record
   * @throws std::runtime_error if the record holds an unknown enum value
   */
  static MetricTypeDefinition fromRecord(
    const osc_transfer::MetricTypeRecord& record);

  bool operator==(const MetricTypeDefinition&) const = default;
};

}  // namespace osc_data

#endif  // OSC_DATA_METRIC_TYPE_HPP
