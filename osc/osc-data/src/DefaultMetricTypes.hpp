// Ticket: 0001_first_start_bootstrap

#ifndef OSC_DATA_DEFAULT_METRIC_TYPES_HPP
#define OSC_DATA_DEFAULT_METRIC_TYPES_HPP

#include <vector>

#include "osc-data/src/MetricType.hpp"

namespace osc_data
{

/**
 * @brief Build the metric-type definitions seeded on first start
 *
 * Ten planetary weight channels (Mercury through Pluto, then the Moon) are
 * pinned, enabled and ordered by distance from the sun. They are followed by
 * the legacy body metrics, all disabled, and by the comment, date, time and
 * user fields, which stay enabled.
 *
 * Pure: every call returns an identical sequence.
 */
std::vector<MetricTypeDefinition> buildDefaultMetricTypes();

/**
 * @brief Select the enabled and pinned definitions in display order
 *
 * Stable sort on displayOrder, so entries sharing an order keep their
 * relative position from @p definitions.
 */
std::vector<MetricTypeDefinition> pinnedMetricTypes(
  const std::vector<MetricTypeDefinition>& definitions);

}  // namespace osc_data

#endif  // OSC_DATA_DEFAULT_METRIC_TYPES_HPP
