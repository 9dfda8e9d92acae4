// Ticket: 0001_first_start_bootstrap

#ifndef OSC_TRANSFER_METRIC_TYPE_RECORD_HPP
#define OSC_TRANSFER_METRIC_TYPE_RECORD_HPP

#include <cstdint>
#include <string>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace osc_transfer
{

/**
 * @brief Database record for one metric-type definition
 *
 * Enumerations are stored by their stable integer value and booleans as
 * uint32_t 0/1. An empty name means "use the default label for the key".
 *
 * @ticket 0001_first_start_bootstrap
 */
struct MetricTypeRecord : public cpp_sqlite::BaseTransferObject
{
  uint32_t type_key{0};
  std::string name;
  uint32_t unit{0};
  uint32_t color{0};  // ARGB
  uint32_t icon{0};
  uint32_t input_type{0};
  uint32_t display_order{0};
  uint32_t is_derived{0};         // Boolean as uint32_t for SQLite
  uint32_t is_pinned{0};          // Boolean as uint32_t for SQLite
  uint32_t is_enabled{1};         // Boolean as uint32_t for SQLite
  uint32_t is_on_right_y_axis{0}; // Boolean as uint32_t for SQLite
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(MetricTypeRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (type_key,
                       name,
                       unit,
                       color,
                       icon,
                       input_type,
                       display_order,
                       is_derived,
                       is_pinned,
                       is_enabled,
                       is_on_right_y_axis));

}  // namespace osc_transfer

#endif  // OSC_TRANSFER_METRIC_TYPE_RECORD_HPP
