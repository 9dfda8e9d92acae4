// Ticket: 0001_first_start_bootstrap

#ifndef OSC_STORE_METRIC_TYPE_STORE_HPP
#define OSC_STORE_METRIC_TYPE_STORE_HPP

#include <cstddef>
#include <vector>

#include "osc-data/src/MetricType.hpp"

namespace osc_store
{

/**
 * @brief Abstract interface for persisted metric-type definitions
 *
 * Implementations must be safe to call from several threads.
 */
class MetricTypeStore
{
public:
  virtual ~MetricTypeStore() = default;

  /**
   * @brief Persist definitions as one logical write
   *
   * Either every definition that was not already stored is written, or
   * nothing is. Implementations should tolerate a repeated call with the
   * same definitions without duplicating them.
   *
   * @return Number of definitions actually written
   * @throws std::runtime_error if the write is rejected
   */
  virtual std::size_t insertAll(
    const std::vector<osc_data::MetricTypeDefinition>& definitions) = 0;

  /**
   * @brief All stored definitions in insertion order
   * @throws std::runtime_error if the storage cannot be read
   */
  virtual std::vector<osc_data::MetricTypeDefinition> selectAll() = 0;

protected:
  MetricTypeStore() = default;
  MetricTypeStore(const MetricTypeStore&) = default;
  MetricTypeStore& operator=(const MetricTypeStore&) = default;
  MetricTypeStore(MetricTypeStore&&) noexcept = default;
  MetricTypeStore& operator=(MetricTypeStore&&) noexcept = default;
};

}  // namespace osc_store

#endif  // OSC_STORE_METRIC_TYPE_STORE_HPP
