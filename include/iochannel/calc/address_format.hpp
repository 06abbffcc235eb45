/**
 * @file address_format.hpp
 * @brief iochannel source file.
 */

#pragma once

#include <cstdint>
#include <string>

#include "iochannel/core/signal_class.hpp"

namespace ioc {

/**
 * @brief PLC absolute address text: BOOL bit offset `a` -> "%MX<a/8>.<a%8>",
 * REAL byte offset `a` -> "%MD<a>".
 */
std::string formatPlcAddress(DataType dataType, std::int64_t address);

/**
 * @brief Host (Modbus) communication address of a point.
 *
 * BOOL points map onto coils from 3001 (`a + 3001`); REAL points onto holding
 * registers from 43001, two registers per 4-byte value (`a / 2 + 43001`).
 */
std::int64_t hostCommAddress(DataType dataType, std::int64_t address) noexcept;

} // namespace ioc
