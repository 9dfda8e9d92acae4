#ifndef OSC_TRANSFER_RECORDS_HPP
#define OSC_TRANSFER_RECORDS_HPP

/**
 * @file Records.hpp
 * @brief Convenience header including all database transfer objects
 */

#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>

#include "osc-transfer/src/MetricTypeRecord.hpp"

namespace osc_transfer
{

/**
 * @brief Type alias for cpp_sqlite Database
 */
using Database = cpp_sqlite::Database;

}  // namespace osc_transfer

#endif  // OSC_TRANSFER_RECORDS_HPP
