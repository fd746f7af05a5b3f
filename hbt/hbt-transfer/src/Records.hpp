#ifndef HBT_TRANSFER_RECORDS_HPP
#define HBT_TRANSFER_RECORDS_HPP

/**
 * @file Records.hpp
 * @brief Convenience header including all stored record types
 */

#include "hbt-transfer/src/ConsumptionEventRecord.hpp"
#include "hbt-transfer/src/DrugLevelRecord.hpp"
#include "hbt-transfer/src/HabitRecord.hpp"

#endif  // HBT_TRANSFER_RECORDS_HPP
